#include "from_followpos.hpp"
#include <map>
#include <queue>
#include <utility>

namespace redfa::dfa {

namespace {

Label follow_on(const tree::AnnotatedTree& annotated,
                const Label& positions,
                char c) {
    const auto& syntax_tree = annotated.tree;
    Label result;
    for (auto p : positions) {
        if (p == syntax_tree.end_marker || syntax_tree.symbol_at(p) != c) {
            continue;
        }
        const auto& follow = annotated.attributes.follow(p);
        result.insert(follow.begin(), follow.end());
    }
    return result;
}

}  // namespace

Automaton from_followpos(const tree::AnnotatedTree& annotated) {
    const auto& syntax_tree = annotated.tree;
    const auto end_marker = syntax_tree.end_marker;

    Automaton dfa;
    dfa.alphabet = syntax_tree.alphabet;
    dfa.label_kind = LabelKind::positions;
    std::map<Label, StateID> state_map;

    Label initial = annotated.attributes.at(syntax_tree.root).firstpos;
    const bool initial_accepting = initial.contains(end_marker);
    const auto initial_id = dfa.create_state(initial, initial_accepting);
    state_map.emplace(std::move(initial), initial_id);
    dfa.start_state = initial_id;

    std::queue<StateID> processing;
    processing.push(initial_id);

    while (!processing.empty()) {
        const auto dfa_state = processing.front();
        processing.pop();

        const auto positions = dfa.states[dfa_state].label;

        for (char c : dfa.alphabet) {
            auto target = follow_on(annotated, positions, c);
            if (target.empty()) {
                continue;
            }

            auto it = state_map.find(target);
            if (it == state_map.end()) {
                const bool accepting = target.contains(end_marker);
                const auto new_id = dfa.create_state(target, accepting);
                it = state_map.emplace(std::move(target), new_id).first;
                processing.push(new_id);
            }

            dfa.add_transition(dfa_state, c, it->second);
        }
    }

    return dfa;
}

}  // namespace redfa::dfa
