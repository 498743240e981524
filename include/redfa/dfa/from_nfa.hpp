#pragma once

#include <set>
#include "automaton.hpp"
#include "nfa.hpp"

namespace redfa::dfa {

// Subset construction. The result is total over `alphabet`: every missing
// move goes to a single shared dead state.
Automaton from_nfa(const nfa::NFA& nfa, const std::set<char>& alphabet);

// Merges the states of a subset-constructed `dfa` whose labels agree on the
// significant states of `nfa`. Each group keeps the label of its first member
// and new ids follow creation order. The result stays total.
Automaton optimize_by_significant_states(const Automaton& dfa,
                                         const nfa::NFA& nfa);

}  // namespace redfa::dfa
