#include "recognizer.hpp"
#include <queue>
#include <ranges>
#include <string>
#include <utility>

namespace redfa::recognize {

namespace {

template <typename Trace>
Trace stop(Trace trace, Outcome outcome, std::string_view input) {
    trace.accepted = outcome == Outcome::accepted;
    trace.outcome = outcome;
    trace.remaining = std::string{input.substr(trace.consumed)};
    return trace;
}

}  // namespace

RecognitionTrace recognize(const dfa::Automaton& automaton,
                           std::string_view input) {
    RecognitionTrace trace;
    auto current = automaton.start_state;
    trace.final_state = current;

    for (char c : input) {
        if (!automaton.alphabet.contains(c)) {
            return stop(std::move(trace), Outcome::unknown_symbol, input);
        }

        auto next = automaton.transition(current, c);
        if (!next) {
            return stop(std::move(trace), Outcome::no_transition, input);
        }

        trace.steps.push_back(Step{c, current, *next});
        ++trace.consumed;
        current = *next;
        trace.final_state = current;

        if (automaton.is_dead(current)) {
            return stop(std::move(trace), Outcome::entered_dead_state, input);
        }
    }

    return stop(std::move(trace),
                automaton.is_accepting(current)
                    ? Outcome::accepted
                    : Outcome::rejected_in_non_accepting_state,
                input);
}

NFATrace recognize(const nfa::NFA& nfa, std::string_view input) {
    NFATrace trace;
    trace.initial =
        nfa::epsilon_closure<std::set>(nfa, std::views::single(nfa.start_state));
    StateSet current = trace.initial;

    for (char c : input) {
        auto next = nfa::epsilon_closure<std::set>(
            nfa, nfa::move_on<std::set>(nfa, current, c));
        if (next.empty()) {
            return stop(std::move(trace), Outcome::no_transition, input);
        }

        trace.steps.push_back(NFAStep{c, current, next});
        ++trace.consumed;
        current = std::move(next);
    }

    return stop(std::move(trace),
                current.contains(nfa.accept_state)
                    ? Outcome::accepted
                    : Outcome::rejected_in_non_accepting_state,
                input);
}

std::string_view describe(Outcome outcome) {
    switch (outcome) {
        case Outcome::accepted:
            return "accepted";
        case Outcome::rejected_in_non_accepting_state:
            return "rejected: input ended in a non-accepting state";
        case Outcome::no_transition:
            return "rejected: no transition for the next symbol";
        case Outcome::unknown_symbol:
            return "rejected: symbol does not belong to the alphabet";
        case Outcome::entered_dead_state:
            return "rejected: entered the dead state";
    }
    return "unknown outcome";
}

std::string to_string(const RecognitionTrace& trace) {
    std::string result;
    for (const auto& step : trace.steps) {
        result += std::to_string(step.from) + " --" + step.symbol + "--> " +
                  std::to_string(step.to) + '\n';
    }
    if (!trace.remaining.empty()) {
        result += "unconsumed: \"" + trace.remaining + "\"\n";
    }
    result += std::string{describe(trace.outcome)} + '\n';
    return result;
}

std::vector<std::string> accepted_strings(const dfa::Automaton& automaton,
                                          std::size_t max_length,
                                          std::size_t max_count) {
    std::vector<std::string> result;
    if (max_count == 0) {
        return result;
    }

    std::queue<std::pair<std::string, dfa::StateID>> pending;
    pending.emplace(std::string{}, automaton.start_state);

    while (!pending.empty()) {
        auto [prefix, state] = std::move(pending.front());
        pending.pop();

        if (automaton.is_accepting(state)) {
            result.push_back(prefix);
            if (result.size() == max_count) {
                break;
            }
        }
        if (prefix.size() == max_length) {
            continue;
        }

        for (char c : automaton.alphabet) {
            auto next = automaton.transition(state, c);
            if (!next || automaton.is_dead(*next)) {
                continue;
            }
            pending.emplace(prefix + c, *next);
        }
    }

    return result;
}

std::vector<Validation> validate_strings(const dfa::Automaton& automaton,
                                         const std::vector<std::string>& inputs) {
    std::vector<Validation> result;
    result.reserve(inputs.size());
    for (const auto& input : inputs) {
        result.push_back(Validation{input, recognize(automaton, input)});
    }
    return result;
}

std::optional<std::vector<dfa::StateID>> acceptance_path(
    const dfa::Automaton& automaton, std::string_view input) {
    auto trace = recognize(automaton, input);
    if (!trace.accepted) {
        return std::nullopt;
    }

    std::vector<dfa::StateID> path{automaton.start_state};
    for (const auto& step : trace.steps) {
        path.push_back(step.to);
    }
    return path;
}

}  // namespace redfa::recognize
