#pragma once

#include <cstddef>
#include <variant>
#include "syntax_error.hpp"

namespace redfa::token {

struct Literal {
    char value;
};
struct Concatenation {};
struct Alternation {};
struct KleeneStar {};
struct PositiveClosure {};
struct Optional {};
struct GroupOpen {};
struct GroupClose {};

using Token = std::variant<Literal,
                           Concatenation,
                           Alternation,
                           KleeneStar,
                           PositiveClosure,
                           Optional,
                           GroupOpen,
                           GroupClose>;

// A token together with the offset of the character it was read from.
struct Lexeme {
    Token token;
    std::size_t offset;
};

}  // namespace redfa::token
