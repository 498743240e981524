#include "attributes.hpp"
#include <string>
#include <utility>

namespace redfa::tree {

namespace {

template <typename T>
constexpr bool always_false = false;

PositionSet set_union(const PositionSet& a, const PositionSet& b) {
    PositionSet result = a;
    result.insert(b.begin(), b.end());
    return result;
}

NodeAttributes attributes_of(const Node& node,
                             const std::vector<NodeAttributes>& computed) {
    return std::visit(
        [&computed](auto&& n) -> NodeAttributes {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Leaf>) {
                return {false, {n.position}, {n.position}};
            } else if constexpr (std::is_same_v<T, Union>) {
                const auto& l = computed[n.left];
                const auto& r = computed[n.right];
                return {l.nullable || r.nullable,
                        set_union(l.firstpos, r.firstpos),
                        set_union(l.lastpos, r.lastpos)};
            } else if constexpr (std::is_same_v<T, Concat>) {
                const auto& l = computed[n.left];
                const auto& r = computed[n.right];
                return {l.nullable && r.nullable,
                        l.nullable ? set_union(l.firstpos, r.firstpos)
                                   : l.firstpos,
                        r.nullable ? set_union(l.lastpos, r.lastpos)
                                   : r.lastpos};
            } else if constexpr (std::is_same_v<T, Star> ||
                                 std::is_same_v<T, Optional>) {
                const auto& c = computed[n.child];
                return {true, c.firstpos, c.lastpos};
            } else if constexpr (std::is_same_v<T, Plus>) {
                const auto& c = computed[n.child];
                return {c.nullable, c.firstpos, c.lastpos};
            } else {
                static_assert(always_false<T>, "Non-exhaustive visitor");
            }
        },
        node);
}

void add_follow(std::map<Position, PositionSet>& followpos,
                const PositionSet& from,
                const PositionSet& to) {
    for (Position p : from) {
        followpos[p].insert(to.begin(), to.end());
    }
}

}  // namespace

const NodeAttributes& Attributes::at(NodeID id) const {
    return nodes.at(id);
}

const PositionSet& Attributes::follow(Position position) const {
    return followpos.at(position);
}

Attributes compute_attributes(const SyntaxTree& tree) {
    Attributes attributes;
    attributes.nodes.reserve(tree.nodes.size());

    // Children precede their parents, so one forward pass is bottom-up.
    for (const auto& node : tree.nodes) {
        attributes.nodes.push_back(attributes_of(node, attributes.nodes));
    }

    for (const auto& [position, _] : tree.positions) {
        attributes.followpos.try_emplace(position);
    }

    for (auto id = tree.nodes.size(); id-- > 0;) {
        const auto& node = tree.nodes[id];
        if (const auto* concat = std::get_if<Concat>(&node)) {
            add_follow(attributes.followpos,
                       attributes.nodes[concat->left].lastpos,
                       attributes.nodes[concat->right].firstpos);
        } else if (const auto* star = std::get_if<Star>(&node)) {
            add_follow(attributes.followpos,
                       attributes.nodes[star->child].lastpos,
                       attributes.nodes[star->child].firstpos);
        } else if (const auto* plus = std::get_if<Plus>(&node)) {
            add_follow(attributes.followpos,
                       attributes.nodes[plus->child].lastpos,
                       attributes.nodes[plus->child].firstpos);
        }
    }

    return attributes;
}

AnnotatedTree annotate(SyntaxTree tree) {
    auto attributes = compute_attributes(tree);
    return {std::move(tree), std::move(attributes)};
}

std::string to_string(const PositionSet& positions) {
    std::string result = "{";
    for (auto it = positions.begin(); it != positions.end(); ++it) {
        if (it != positions.begin()) {
            result += ", ";
        }
        result += std::to_string(*it);
    }
    return result + "}";
}

std::string to_string(const AnnotatedTree& annotated) {
    const auto& tree = annotated.tree;
    std::string result;
    if (tree.nodes.empty()) {
        return result;
    }

    std::vector<std::pair<NodeID, std::size_t>> pending{{tree.root, 0}};
    while (!pending.empty()) {
        auto [id, depth] = pending.back();
        pending.pop_back();

        const auto& node = tree.node(id);
        const auto& attrs = annotated.attributes.at(id);
        result += std::string(depth * 2, ' ') + node_name(node) +
                  (attrs.nullable ? " nullable" : "") +
                  " first=" + to_string(attrs.firstpos) +
                  " last=" + to_string(attrs.lastpos) + '\n';

        auto kids = children(node);
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            pending.emplace_back(*it, depth + 1);
        }
    }
    return result;
}

std::string followpos_table(const AnnotatedTree& annotated) {
    std::string result;
    for (const auto& [position, follow] : annotated.attributes.followpos) {
        result += std::to_string(position) + " '" +
                  annotated.tree.symbol_at(position) + "' -> " +
                  to_string(follow) + '\n';
    }
    return result;
}

}  // namespace redfa::tree
