#include "from_postfix.hpp"
#include <stack>
#include "shunting_yard.hpp"
#include "tokenize.hpp"

namespace redfa::tree {

namespace {

template <typename T>
constexpr bool always_false = false;

template <typename Binary>
void handle_binary(SyntaxTree& tree, std::stack<NodeID>& node_stack) {
    if (node_stack.size() < 2) {
        throw BuildError("Insufficient operands for binary operator");
    }
    const auto rhs = node_stack.top();
    node_stack.pop();
    const auto lhs = node_stack.top();
    node_stack.pop();
    node_stack.push(tree.add_node(Binary{lhs, rhs}));
}

template <typename Unary>
void handle_unary(SyntaxTree& tree, std::stack<NodeID>& node_stack) {
    if (node_stack.empty()) {
        throw BuildError("Missing operand for unary operator");
    }
    const auto child = node_stack.top();
    node_stack.pop();
    node_stack.push(tree.add_node(Unary{child}));
}

}  // namespace

SyntaxTree from_postfix(const std::vector<token::Token>& postfix) {
    SyntaxTree tree;
    std::stack<NodeID> node_stack;

    for (const auto& token : postfix) {
        std::visit(
            [&](auto&& tok) {
                using T = std::decay_t<decltype(tok)>;

                if constexpr (std::is_same_v<T, token::Literal>) {
                    tree.add_leaf(tok.value);
                    node_stack.push(tree.nodes.size() - 1);
                } else if constexpr (std::is_same_v<T, token::Concatenation>) {
                    handle_binary<Concat>(tree, node_stack);
                } else if constexpr (std::is_same_v<T, token::Alternation>) {
                    handle_binary<Union>(tree, node_stack);
                } else if constexpr (std::is_same_v<T, token::KleeneStar>) {
                    handle_unary<Star>(tree, node_stack);
                } else if constexpr (std::is_same_v<T,
                                                    token::PositiveClosure>) {
                    handle_unary<Plus>(tree, node_stack);
                } else if constexpr (std::is_same_v<T, token::Optional>) {
                    handle_unary<Optional>(tree, node_stack);
                } else if constexpr (std::is_same_v<T, token::GroupOpen> ||
                                     std::is_same_v<T, token::GroupClose>) {
                    throw BuildError(
                        "Unexpected grouping operator in postfix notation");
                } else {
                    static_assert(always_false<T>, "Non-exhaustive visitor");
                }
            },
            token);
    }

    if (node_stack.size() != 1) {
        throw BuildError(
            "Malformed expression stack: multiple fragments remaining");
    }

    tree.augment();
    return tree;
}

SyntaxTree parse(std::string_view pattern) {
    return from_postfix(token::shunting_yard(token::tokenize(pattern)));
}

}  // namespace redfa::tree
