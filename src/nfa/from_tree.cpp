#include "from_tree.hpp"
#include <optional>
#include <vector>
#include "nfa.hpp"

namespace redfa::nfa {

namespace {

struct Fragment {
    StateID start;
    StateID end;
};

template <typename T>
constexpr bool always_false = false;

class FragmentTable {
public:
    explicit FragmentTable(std::size_t size) : fragments_(size) {}

    void set(tree::NodeID id, Fragment fragment) { fragments_[id] = fragment; }

    Fragment get(tree::NodeID id) const {
        if (id >= fragments_.size() || !fragments_[id].has_value()) {
            throw BuildError("Child node has no fragment");
        }
        return *fragments_[id];
    }

private:
    std::vector<std::optional<Fragment>> fragments_;
};

Fragment handle_leaf(NFA& nfa, const tree::Leaf& leaf) {
    const auto start = nfa.create_state();
    const auto end = nfa.create_state();
    nfa.add_transition(start, leaf.symbol, end);
    return {start, end};
}

Fragment handle_concat(NFA& nfa, Fragment lhs, Fragment rhs) {
    nfa.add_transition(lhs.end, EpsilonTransition{}, rhs.start);
    return {lhs.start, rhs.end};
}

Fragment handle_union(NFA& nfa, Fragment lhs, Fragment rhs) {
    const auto new_start = nfa.create_state();
    const auto new_end = nfa.create_state();

    nfa.add_transition(new_start, EpsilonTransition{}, lhs.start);
    nfa.add_transition(new_start, EpsilonTransition{}, rhs.start);
    nfa.add_transition(lhs.end, EpsilonTransition{}, new_end);
    nfa.add_transition(rhs.end, EpsilonTransition{}, new_end);

    return {new_start, new_end};
}

// Star, Plus and Optional share the same wrapper; they differ in whether
// the bypass and the back edge exist.
Fragment handle_repetition(NFA& nfa,
                           Fragment inner,
                           bool bypass,
                           bool repeat) {
    const auto new_start = nfa.create_state();
    const auto new_end = nfa.create_state();

    nfa.add_transition(new_start, EpsilonTransition{}, inner.start);
    if (bypass) {
        nfa.add_transition(new_start, EpsilonTransition{}, new_end);
    }
    if (repeat) {
        nfa.add_transition(inner.end, EpsilonTransition{}, inner.start);
    }
    nfa.add_transition(inner.end, EpsilonTransition{}, new_end);

    return {new_start, new_end};
}

}  // namespace

NFA from_tree(const tree::SyntaxTree& syntax_tree) {
    if (syntax_tree.nodes.empty() ||
        syntax_tree.expression >= syntax_tree.nodes.size()) {
        throw BuildError("Syntax tree has no expression");
    }

    NFA nfa;
    FragmentTable fragments(syntax_tree.expression + 1);

    // Post-order ids: every node of the expression subtree is at or before
    // the expression root, the end marker and augmented root come after.
    for (tree::NodeID id = 0; id <= syntax_tree.expression; ++id) {
        const Fragment frag = std::visit(
            [&](auto&& node) -> Fragment {
                using T = std::decay_t<decltype(node)>;

                if constexpr (std::is_same_v<T, tree::Leaf>) {
                    return handle_leaf(nfa, node);
                } else if constexpr (std::is_same_v<T, tree::Concat>) {
                    return handle_concat(nfa, fragments.get(node.left),
                                         fragments.get(node.right));
                } else if constexpr (std::is_same_v<T, tree::Union>) {
                    return handle_union(nfa, fragments.get(node.left),
                                        fragments.get(node.right));
                } else if constexpr (std::is_same_v<T, tree::Star>) {
                    return handle_repetition(nfa, fragments.get(node.child),
                                             true, true);
                } else if constexpr (std::is_same_v<T, tree::Plus>) {
                    return handle_repetition(nfa, fragments.get(node.child),
                                             false, true);
                } else if constexpr (std::is_same_v<T, tree::Optional>) {
                    return handle_repetition(nfa, fragments.get(node.child),
                                             true, false);
                } else {
                    static_assert(always_false<T>, "Non-exhaustive visitor");
                }
            },
            syntax_tree.node(id));
        fragments.set(id, frag);
    }

    const Fragment final_frag = fragments.get(syntax_tree.expression);
    nfa.start_state = final_frag.start;
    nfa.accept_state = final_frag.end;

    return nfa;
}

}  // namespace redfa::nfa
