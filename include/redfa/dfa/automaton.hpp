#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace redfa::dfa {

using StateID = std::size_t;

// Sorted set of syntax-tree positions or NFA state ids the DFA state stands
// for. Two states never share a label.
using Label = std::set<std::size_t>;

enum class LabelKind { positions, nfa_states };

struct State {
    StateID id;
    Label label;
    bool accepting;

    bool operator==(const State&) const = default;
};

class Automaton {
public:
    Automaton() = default;

    StateID create_state(Label label, bool accepting);
    void add_transition(StateID from, char c, StateID to);

    std::optional<StateID> transition(StateID from, char c) const;
    bool is_accepting(StateID state) const;
    bool is_dead(StateID state) const;
    bool is_total() const;

    bool operator==(const Automaton&) const = default;

    std::vector<State> states;
    std::set<char> alphabet;
    std::vector<std::map<char, StateID>> transitions;
    StateID start_state = 0;
    // Only state allowed an empty label; set by subset construction.
    std::optional<StateID> dead_state;
    LabelKind label_kind = LabelKind::positions;
};

struct Statistics {
    std::size_t states = 0;
    std::size_t accepting_states = 0;
    std::size_t transitions = 0;
    std::size_t alphabet_size = 0;
    bool total = false;
    bool has_dead_state = false;
    bool deterministic = true;
    bool has_epsilon_transitions = false;
};

Statistics statistics(const Automaton& automaton);

std::string to_string(const Automaton& automaton);

}  // namespace redfa::dfa
