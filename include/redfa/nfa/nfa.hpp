#pragma once

#include <cstddef>
#include <queue>
#include <ranges>
#include <set>
#include <variant>
#include <vector>

namespace redfa::nfa {

using StateID = std::size_t;

struct EpsilonTransition {
    bool operator==(const EpsilonTransition&) const = default;
};
using TransitionCondition = std::variant<EpsilonTransition, char>;

struct Transition {
    TransitionCondition condition;
    StateID target;

    bool operator==(const Transition&) const = default;
};

class NFA {
public:
    NFA() = default;

    StateID create_state();
    void add_transition(StateID from, TransitionCondition cond, StateID to);

    std::vector<std::vector<Transition>> states;
    StateID start_state = 0;
    StateID accept_state = 0;
};

struct Statistics {
    std::size_t states = 0;
    std::size_t transitions = 0;
    std::size_t epsilon_transitions = 0;
    std::size_t significant_states = 0;
    bool has_epsilon_transitions = false;
    bool deterministic = false;
};

// States with at least one symbol transition, plus the accept state. Two
// subsets that agree on these states have the same future.
std::set<StateID> significant_states(const NFA& nfa);

bool is_deterministic(const NFA& nfa);

Statistics statistics(const NFA& nfa);

template <template <class...> class Set, std::ranges::input_range R>
Set<StateID> epsilon_closure(const NFA& nfa, R&& states) {
    Set<StateID> closure(std::ranges::begin(states), std::ranges::end(states));
    std::queue<StateID> processing_queue(closure.begin(), closure.end());

    while (!processing_queue.empty()) {
        auto current = processing_queue.front();
        processing_queue.pop();

        for (const auto& trans : nfa.states[current]) {
            if (std::holds_alternative<EpsilonTransition>(trans.condition) &&
                !closure.contains(trans.target)) {
                closure.insert(trans.target);
                processing_queue.push(trans.target);
            }
        }
    }

    return closure;
}

template <template <class...> class Set, std::ranges::input_range R>
Set<StateID> move_on(const NFA& nfa, R&& states, char c) {
    Set<StateID> result;
    for (auto state : states) {
        for (const auto& trans : nfa.states[state]) {
            if (const auto* ch = std::get_if<char>(&trans.condition)) {
                if (*ch == c) {
                    result.insert(trans.target);
                }
            }
        }
    }
    return result;
}

}  // namespace redfa::nfa
