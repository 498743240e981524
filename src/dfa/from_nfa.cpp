#include "from_nfa.hpp"
#include <map>
#include <queue>
#include <ranges>
#include <set>
#include <utility>
#include <vector>

namespace redfa::dfa {

namespace {

StateID dead_state_of(Automaton& dfa) {
    if (!dfa.dead_state) {
        const auto dead = dfa.create_state({}, false);
        for (char c : dfa.alphabet) {
            dfa.add_transition(dead, c, dead);
        }
        dfa.dead_state = dead;
    }
    return *dfa.dead_state;
}

}  // namespace

Automaton from_nfa(const nfa::NFA& nfa, const std::set<char>& alphabet) {
    Automaton dfa;
    dfa.alphabet = alphabet;
    dfa.label_kind = LabelKind::nfa_states;
    std::map<Label, StateID> state_map;

    auto initial_states =
        nfa::epsilon_closure<std::set>(nfa, std::views::single(nfa.start_state));

    const bool initial_accepting = initial_states.contains(nfa.accept_state);
    const auto initial_id = dfa.create_state(initial_states, initial_accepting);
    state_map.emplace(std::move(initial_states), initial_id);
    dfa.start_state = initial_id;

    std::queue<StateID> processing;
    processing.push(initial_id);

    while (!processing.empty()) {
        const auto dfa_state = processing.front();
        processing.pop();

        const auto nfa_states = dfa.states[dfa_state].label;

        for (char c : alphabet) {
            auto closure = nfa::epsilon_closure<std::set>(
                nfa, nfa::move_on<std::set>(nfa, nfa_states, c));

            if (closure.empty()) {
                dfa.add_transition(dfa_state, c, dead_state_of(dfa));
                continue;
            }

            auto it = state_map.find(closure);
            if (it == state_map.end()) {
                const bool accepting = closure.contains(nfa.accept_state);
                const auto new_id = dfa.create_state(closure, accepting);
                it = state_map.emplace(std::move(closure), new_id).first;
                processing.push(new_id);
            }

            dfa.add_transition(dfa_state, c, it->second);
        }
    }

    return dfa;
}

Automaton optimize_by_significant_states(const Automaton& dfa,
                                         const nfa::NFA& nfa) {
    const auto significant = nfa::significant_states(nfa);

    Automaton result;
    result.alphabet = dfa.alphabet;
    result.label_kind = dfa.label_kind;

    std::map<Label, StateID> groups;
    std::vector<StateID> remap(dfa.states.size());
    std::vector<StateID> representatives;

    for (const auto& state : dfa.states) {
        Label key;
        for (auto s : state.label) {
            if (significant.contains(s)) {
                key.insert(s);
            }
        }

        auto it = groups.find(key);
        if (it == groups.end()) {
            const auto id = result.create_state(state.label, state.accepting);
            it = groups.emplace(std::move(key), id).first;
            representatives.push_back(state.id);
        } else if (state.accepting) {
            result.states[it->second].accepting = true;
        }
        remap[state.id] = it->second;
    }

    for (StateID id = 0; id < representatives.size(); ++id) {
        for (const auto& [c, to] : dfa.transitions[representatives[id]]) {
            result.add_transition(id, c, remap[to]);
        }
    }

    result.start_state = remap[dfa.start_state];
    if (dfa.dead_state) {
        result.dead_state = remap[*dfa.dead_state];
    }
    return result;
}

}  // namespace redfa::dfa
