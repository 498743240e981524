#pragma once

#include <ranges>
#include <stack>
#include <utility>
#include <vector>
#include "token.hpp"

namespace redfa::token {

namespace detail {

template <typename... Alts, typename... Ts>
constexpr bool holds_any_of(const std::variant<Ts...>& v) noexcept {
    return (std::holds_alternative<Alts>(v) || ...);
}

inline int precedence(const Token& token) {
    return std::visit(
        [](auto&& tok) {
            using T = std::decay_t<decltype(tok)>;
            if constexpr (std::is_same_v<T, KleeneStar> ||
                          std::is_same_v<T, PositiveClosure> ||
                          std::is_same_v<T, Optional>) {
                return 3;
            } else if constexpr (std::is_same_v<T, Concatenation>) {
                return 2;
            } else if constexpr (std::is_same_v<T, Alternation>) {
                return 1;
            } else {
                return 0;
            }
        },
        token);
}

inline bool is_operator(const Token& token) {
    return holds_any_of<KleeneStar, PositiveClosure, Optional, Concatenation,
                        Alternation>(token);
}

inline bool is_unary_operator(const Token& token) {
    return holds_any_of<KleeneStar, PositiveClosure, Optional>(token);
}

inline bool is_binary_operator(const Token& token) {
    return holds_any_of<Concatenation, Alternation>(token);
}

inline bool can_start_expr(const Token& token) {
    return holds_any_of<Literal, GroupOpen>(token);
}

}  // namespace detail

// Validates the lexeme sequence and converts it to postfix notation,
// inserting the implicit concatenations.
template <std::ranges::input_range R>
std::vector<Token> shunting_yard(R&& lexemes) {
    using namespace detail;
    std::vector<Token> output;
    std::stack<Lexeme> op_stack;
    bool prev_was_operand = false;
    std::size_t last_offset = 0;

    for (auto&& lexeme : lexemes) {
        const Token& token = lexeme.token;
        last_offset = lexeme.offset;

        if (prev_was_operand && can_start_expr(token)) {
            Lexeme concat{Concatenation{}, lexeme.offset};
            while (!op_stack.empty() && is_operator(op_stack.top().token) &&
                   precedence(op_stack.top().token) >=
                       precedence(concat.token)) {
                output.push_back(std::move(op_stack.top().token));
                op_stack.pop();
            }
            op_stack.push(std::move(concat));
        }

        if (std::holds_alternative<GroupOpen>(token)) {
            op_stack.push(lexeme);
            prev_was_operand = false;
        } else if (std::holds_alternative<GroupClose>(token)) {
            if (!prev_was_operand) {
                if (!op_stack.empty() &&
                    std::holds_alternative<GroupOpen>(op_stack.top().token)) {
                    throw SyntaxError("Empty group", lexeme.offset);
                }
                throw SyntaxError("Missing right operand for binary operator",
                                  lexeme.offset);
            }

            while (!op_stack.empty() &&
                   !std::holds_alternative<GroupOpen>(op_stack.top().token)) {
                output.push_back(std::move(op_stack.top().token));
                op_stack.pop();
            }

            if (op_stack.empty()) {
                throw SyntaxError("Unbalanced parentheses", lexeme.offset);
            }

            op_stack.pop();
            prev_was_operand = true;
        } else if (is_operator(token)) {
            if (is_binary_operator(token) && !prev_was_operand) {
                throw SyntaxError("Missing left operand for binary operator",
                                  lexeme.offset);
            }
            if (is_unary_operator(token) && !prev_was_operand) {
                throw SyntaxError("Missing operand for unary operator",
                                  lexeme.offset);
            }

            while (!op_stack.empty() && is_operator(op_stack.top().token)) {
                // Binary operators are left associative and stacked postfix
                // operators apply inside out, so equal precedence pops too.
                if (precedence(op_stack.top().token) >= precedence(token)) {
                    output.push_back(std::move(op_stack.top().token));
                    op_stack.pop();
                } else {
                    break;
                }
            }

            op_stack.push(lexeme);
            prev_was_operand = is_unary_operator(token);
        } else {
            output.push_back(token);
            prev_was_operand = true;
        }
    }

    if (!prev_was_operand) {
        if (!op_stack.empty() &&
            std::holds_alternative<GroupOpen>(op_stack.top().token)) {
            throw SyntaxError("Unbalanced parentheses", op_stack.top().offset);
        }
        throw SyntaxError("Missing right operand for binary operator",
                          last_offset);
    }

    while (!op_stack.empty()) {
        if (std::holds_alternative<GroupOpen>(op_stack.top().token)) {
            throw SyntaxError("Unbalanced parentheses",
                              op_stack.top().offset);
        }
        output.push_back(std::move(op_stack.top().token));
        op_stack.pop();
    }

    return output;
}

}  // namespace redfa::token
