#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "automaton.hpp"
#include "nfa.hpp"

namespace redfa::recognize {

enum class Outcome {
    accepted,
    rejected_in_non_accepting_state,
    no_transition,
    unknown_symbol,
    entered_dead_state,
};

struct Step {
    char symbol;
    dfa::StateID from;
    dfa::StateID to;

    bool operator==(const Step&) const = default;
};

struct RecognitionTrace {
    std::vector<Step> steps;
    bool accepted = false;
    Outcome outcome = Outcome::rejected_in_non_accepting_state;
    dfa::StateID final_state = 0;
    std::size_t consumed = 0;
    std::string remaining;
};

// Replays `input` on `automaton`. Never throws for any input: symbols
// outside the alphabet and missing transitions end the trace early with a
// rejecting outcome.
RecognitionTrace recognize(const dfa::Automaton& automaton,
                           std::string_view input);

using StateSet = std::set<nfa::StateID>;

struct NFAStep {
    char symbol;
    StateSet from;
    StateSet to;

    bool operator==(const NFAStep&) const = default;
};

struct NFATrace {
    StateSet initial;
    std::vector<NFAStep> steps;
    bool accepted = false;
    Outcome outcome = Outcome::rejected_in_non_accepting_state;
    std::size_t consumed = 0;
    std::string remaining;
};

NFATrace recognize(const nfa::NFA& nfa, std::string_view input);

std::string_view describe(Outcome outcome);

std::string to_string(const RecognitionTrace& trace);

// Strings accepted by `automaton`, shortest first and in alphabet order within
// a length, up to `max_length` symbols and `max_count` strings.
std::vector<std::string> accepted_strings(const dfa::Automaton& automaton,
                                          std::size_t max_length = 5,
                                          std::size_t max_count = 100);

struct Validation {
    std::string input;
    RecognitionTrace trace;
};

std::vector<Validation> validate_strings(const dfa::Automaton& automaton,
                                         const std::vector<std::string>& inputs);

// Start state followed by the target of every step, or nothing when `input`
// is rejected.
std::optional<std::vector<dfa::StateID>> acceptance_path(
    const dfa::Automaton& automaton, std::string_view input);

}  // namespace redfa::recognize
