#include "automaton.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace redfa::dfa {

StateID Automaton::create_state(Label label, bool accepting) {
    const StateID id = states.size();
    states.push_back(State{id, std::move(label), accepting});
    transitions.emplace_back();
    return id;
}

void Automaton::add_transition(StateID from, char c, StateID to) {
    transitions.at(from)[c] = to;
}

std::optional<StateID> Automaton::transition(StateID from, char c) const {
    const auto& state_transitions = transitions.at(from);
    if (auto it = state_transitions.find(c); it != state_transitions.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Automaton::is_accepting(StateID state) const {
    return states.at(state).accepting;
}

bool Automaton::is_dead(StateID state) const {
    return dead_state == state;
}

bool Automaton::is_total() const {
    return std::ranges::all_of(transitions, [this](const auto& row) {
        return std::ranges::all_of(
            alphabet, [&row](char c) { return row.contains(c); });
    });
}

Statistics statistics(const Automaton& automaton) {
    Statistics stats;
    stats.states = automaton.states.size();
    stats.accepting_states = std::ranges::count_if(
        automaton.states, [](const State& s) { return s.accepting; });
    for (const auto& row : automaton.transitions) {
        stats.transitions += row.size();
    }
    stats.alphabet_size = automaton.alphabet.size();
    stats.total = automaton.is_total();
    stats.has_dead_state = automaton.dead_state.has_value();
    // One target per (state, symbol) and no epsilon moves by construction.
    stats.deterministic = true;
    stats.has_epsilon_transitions = false;
    return stats;
}

namespace {

std::string label_to_string(const Label& label) {
    std::string result = "{";
    for (auto it = label.begin(); it != label.end(); ++it) {
        if (it != label.begin()) {
            result += ",";
        }
        result += std::to_string(*it);
    }
    return result + "}";
}

std::string pad(std::string s, std::size_t width) {
    if (s.size() < width) {
        s.append(width - s.size(), ' ');
    }
    return s;
}

}  // namespace

std::string to_string(const Automaton& automaton) {
    std::size_t label_width = 5;
    for (const auto& state : automaton.states) {
        label_width =
            std::max(label_width, label_to_string(state.label).size());
    }

    std::string result = pad("", 4) + pad("state", 6) +
                         pad("label", label_width + 1);
    for (char c : automaton.alphabet) {
        result += pad(std::string(1, c), 6);
    }
    result += '\n';

    for (const auto& state : automaton.states) {
        std::string marker;
        marker += state.id == automaton.start_state ? "->" : "  ";
        marker += state.accepting ? "*" : " ";
        result += pad(marker, 4) + pad(std::to_string(state.id), 6) +
                  pad(label_to_string(state.label), label_width + 1);
        for (char c : automaton.alphabet) {
            auto target = automaton.transition(state.id, c);
            result += pad(target ? std::to_string(*target) : "-", 6);
        }
        result += '\n';
    }
    return result;
}

}  // namespace redfa::dfa
