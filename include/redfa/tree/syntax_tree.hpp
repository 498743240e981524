#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace redfa::tree {

using NodeID = std::size_t;
using Position = std::size_t;

inline constexpr char end_marker_symbol = '#';

struct Leaf {
    char symbol;
    Position position;

    bool operator==(const Leaf&) const = default;
};
struct Concat {
    NodeID left;
    NodeID right;

    bool operator==(const Concat&) const = default;
};
struct Union {
    NodeID left;
    NodeID right;

    bool operator==(const Union&) const = default;
};
struct Star {
    NodeID child;

    bool operator==(const Star&) const = default;
};
struct Plus {
    NodeID child;

    bool operator==(const Plus&) const = default;
};
struct Optional {
    NodeID child;

    bool operator==(const Optional&) const = default;
};

using Node = std::variant<Leaf, Concat, Union, Star, Plus, Optional>;

// Nodes are stored in post-order: the children of a node always have
// smaller ids than the node itself. The tree is augmented with a trailing
// end marker, so `root` is Concat(expression, Leaf('#', end_marker)).
class SyntaxTree {
public:
    SyntaxTree() = default;

    NodeID add_node(Node node);
    Position add_leaf(char symbol);
    void augment();

    const Node& node(NodeID id) const;
    char symbol_at(Position position) const;

    bool operator==(const SyntaxTree&) const = default;

    std::vector<Node> nodes;
    NodeID root = 0;
    NodeID expression = 0;
    Position end_marker = 0;
    std::map<Position, char> positions;
    std::set<char> alphabet;
};

std::vector<NodeID> children(const Node& node);

std::string node_name(const Node& node);

std::string to_string(const SyntaxTree& tree);

}  // namespace redfa::tree
