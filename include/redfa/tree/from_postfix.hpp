#pragma once

#include <stdexcept>
#include <string_view>
#include <vector>
#include "syntax_tree.hpp"
#include "token.hpp"

namespace redfa::tree {

class BuildError : public std::runtime_error {
public:
    using BuildError::runtime_error::runtime_error;
};

SyntaxTree from_postfix(const std::vector<token::Token>& postfix);

// Tokenizes, validates and builds the augmented syntax tree of `pattern`.
// Throws redfa::SyntaxError on malformed input.
SyntaxTree parse(std::string_view pattern);

}  // namespace redfa::tree
