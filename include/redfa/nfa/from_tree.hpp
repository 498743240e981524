#pragma once

#include <stdexcept>
#include "nfa.hpp"
#include "syntax_tree.hpp"

namespace redfa::nfa {

class BuildError : public std::runtime_error {
public:
    using BuildError::runtime_error::runtime_error;
};

// Thompson construction over the user expression of `tree`. The end marker
// is left out; the accept state of the result stands in for it.
NFA from_tree(const tree::SyntaxTree& tree);

}  // namespace redfa::nfa
