#pragma once

#include "attributes.hpp"
#include "automaton.hpp"

namespace redfa::dfa {

// Builds a DFA straight from firstpos/followpos of the augmented tree. The
// transition function is partial and no dead state is created.
Automaton from_followpos(const tree::AnnotatedTree& annotated);

}  // namespace redfa::dfa
