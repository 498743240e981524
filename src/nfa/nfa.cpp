#include "nfa.hpp"
#include <set>
#include <utility>

namespace redfa::nfa {

StateID NFA::create_state() {
    states.emplace_back();
    return states.size() - 1;
}

void NFA::add_transition(StateID from, TransitionCondition cond, StateID to) {
    states.at(from).emplace_back(Transition{std::move(cond), to});
}

std::set<StateID> significant_states(const NFA& nfa) {
    std::set<StateID> significant;
    for (StateID s = 0; s < nfa.states.size(); ++s) {
        for (const auto& trans : nfa.states[s]) {
            if (std::holds_alternative<char>(trans.condition)) {
                significant.insert(s);
                break;
            }
        }
    }
    significant.insert(nfa.accept_state);
    return significant;
}

bool is_deterministic(const NFA& nfa) {
    for (const auto& state : nfa.states) {
        std::set<char> seen;
        for (const auto& trans : state) {
            const auto* c = std::get_if<char>(&trans.condition);
            if (c == nullptr || !seen.insert(*c).second) {
                return false;
            }
        }
    }
    return true;
}

Statistics statistics(const NFA& nfa) {
    Statistics stats;
    stats.states = nfa.states.size();
    for (const auto& state : nfa.states) {
        stats.transitions += state.size();
        for (const auto& trans : state) {
            if (std::holds_alternative<EpsilonTransition>(trans.condition)) {
                ++stats.epsilon_transitions;
            }
        }
    }
    stats.significant_states = significant_states(nfa).size();
    stats.has_epsilon_transitions = stats.epsilon_transitions > 0;
    stats.deterministic = is_deterministic(nfa);
    return stats;
}

}  // namespace redfa::nfa
