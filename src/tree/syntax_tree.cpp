#include "syntax_tree.hpp"
#include <string>
#include <utility>
#include <vector>

namespace redfa::tree {

namespace {

template <typename T>
constexpr bool always_false = false;

}  // namespace

NodeID SyntaxTree::add_node(Node node) {
    nodes.push_back(std::move(node));
    return nodes.size() - 1;
}

Position SyntaxTree::add_leaf(char symbol) {
    const Position position = positions.size() + 1;
    positions.emplace(position, symbol);
    alphabet.insert(symbol);
    add_node(Leaf{symbol, position});
    return position;
}

void SyntaxTree::augment() {
    expression = nodes.size() - 1;
    end_marker = positions.size() + 1;
    positions.emplace(end_marker, end_marker_symbol);
    const auto marker = add_node(Leaf{end_marker_symbol, end_marker});
    root = add_node(Concat{expression, marker});
}

const Node& SyntaxTree::node(NodeID id) const {
    return nodes.at(id);
}

char SyntaxTree::symbol_at(Position position) const {
    return positions.at(position);
}

std::vector<NodeID> children(const Node& node) {
    return std::visit(
        [](auto&& n) -> std::vector<NodeID> {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Leaf>) {
                return {};
            } else if constexpr (std::is_same_v<T, Concat> ||
                                 std::is_same_v<T, Union>) {
                return {n.left, n.right};
            } else if constexpr (std::is_same_v<T, Star> ||
                                 std::is_same_v<T, Plus> ||
                                 std::is_same_v<T, Optional>) {
                return {n.child};
            } else {
                static_assert(always_false<T>, "Non-exhaustive visitor");
            }
        },
        node);
}

std::string node_name(const Node& node) {
    return std::visit(
        [](auto&& n) -> std::string {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, Leaf>) {
                return "SYMBOL '" + std::string(1, n.symbol) +
                       "' (pos: " + std::to_string(n.position) + ")";
            } else if constexpr (std::is_same_v<T, Concat>) {
                return "CONCAT";
            } else if constexpr (std::is_same_v<T, Union>) {
                return "UNION";
            } else if constexpr (std::is_same_v<T, Star>) {
                return "STAR";
            } else if constexpr (std::is_same_v<T, Plus>) {
                return "PLUS";
            } else if constexpr (std::is_same_v<T, Optional>) {
                return "OPTIONAL";
            } else {
                static_assert(always_false<T>, "Non-exhaustive visitor");
            }
        },
        node);
}

std::string to_string(const SyntaxTree& tree) {
    std::string result;
    if (tree.nodes.empty()) {
        return result;
    }

    std::vector<std::pair<NodeID, std::size_t>> pending{{tree.root, 0}};
    while (!pending.empty()) {
        auto [id, depth] = pending.back();
        pending.pop_back();

        const auto& node = tree.node(id);
        result += std::string(depth * 2, ' ') + node_name(node) + '\n';

        auto kids = children(node);
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
            pending.emplace_back(*it, depth + 1);
        }
    }
    return result;
}

}  // namespace redfa::tree
