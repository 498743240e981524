#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "syntax_tree.hpp"

namespace redfa::tree {

using PositionSet = std::set<Position>;

struct NodeAttributes {
    bool nullable = false;
    PositionSet firstpos;
    PositionSet lastpos;

    bool operator==(const NodeAttributes&) const = default;
};

struct Attributes {
    const NodeAttributes& at(NodeID id) const;
    const PositionSet& follow(Position position) const;

    bool operator==(const Attributes&) const = default;

    std::vector<NodeAttributes> nodes;
    std::map<Position, PositionSet> followpos;
};

struct AnnotatedTree {
    SyntaxTree tree;
    Attributes attributes;
};

Attributes compute_attributes(const SyntaxTree& tree);

AnnotatedTree annotate(SyntaxTree tree);

std::string to_string(const PositionSet& positions);

std::string to_string(const AnnotatedTree& annotated);

std::string followpos_table(const AnnotatedTree& annotated);

}  // namespace redfa::tree
