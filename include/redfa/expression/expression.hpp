#pragma once

#include <optional>
#include <string_view>
#include "attributes.hpp"
#include "automaton.hpp"
#include "nfa.hpp"
#include "recognizer.hpp"
#include "syntax_error.hpp"
#include "syntax_tree.hpp"

namespace redfa {

namespace construction_constants {

using OptionType = std::size_t;

// Followpos construction: partial transition function, no dead state.
inline constexpr OptionType direct = 0;
// Thompson NFA followed by subset construction: total transition function.
inline constexpr OptionType full = 1;
// With `full`: merge subsets that agree on the significant NFA states.
inline constexpr OptionType optimize = 1 << 1;

}  // namespace construction_constants

class Expression {
public:
    using FlagType = construction_constants::OptionType;

    explicit Expression(std::string_view pattern,
                        FlagType f = construction_constants::direct);

    const tree::SyntaxTree& tree() const;
    const tree::Attributes& attributes() const;
    const tree::AnnotatedTree& annotated() const;
    const std::optional<nfa::NFA>& nfa() const;
    const dfa::Automaton& automaton() const;

    recognize::RecognitionTrace recognize(std::string_view input) const;
    bool is_match(std::string_view input) const;

private:
    tree::AnnotatedTree annotated_;
    std::optional<nfa::NFA> nfa_;
    dfa::Automaton automaton_;
};

tree::SyntaxTree parse_syntax_tree(std::string_view pattern);

dfa::Automaton build_full_automaton(std::string_view pattern);

dfa::Automaton build_optimal_automaton(std::string_view pattern);

recognize::RecognitionTrace recognize_string(const dfa::Automaton& automaton,
                                             std::string_view input);

bool match(std::string_view pattern, std::string_view input);

}  // namespace redfa
