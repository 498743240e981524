#include "expression.hpp"
#include <utility>
#include "from_followpos.hpp"
#include "from_nfa.hpp"
#include "from_postfix.hpp"
#include "from_tree.hpp"

namespace redfa {

namespace {

dfa::Automaton full_automaton(const tree::SyntaxTree& syntax_tree,
                              const nfa::NFA& nfa) {
    return dfa::from_nfa(nfa, syntax_tree.alphabet);
}

}  // namespace

Expression::Expression(std::string_view pattern, FlagType f)
    : annotated_(tree::annotate(tree::parse(pattern))) {
    if (f & construction_constants::full) {
        nfa_ = nfa::from_tree(annotated_.tree);
        automaton_ = full_automaton(annotated_.tree, *nfa_);
        if (f & construction_constants::optimize) {
            automaton_ = dfa::optimize_by_significant_states(automaton_, *nfa_);
        }
    } else {
        automaton_ = dfa::from_followpos(annotated_);
    }
}

const tree::SyntaxTree& Expression::tree() const {
    return annotated_.tree;
}

const tree::Attributes& Expression::attributes() const {
    return annotated_.attributes;
}

const tree::AnnotatedTree& Expression::annotated() const {
    return annotated_;
}

const std::optional<nfa::NFA>& Expression::nfa() const {
    return nfa_;
}

const dfa::Automaton& Expression::automaton() const {
    return automaton_;
}

recognize::RecognitionTrace Expression::recognize(
    std::string_view input) const {
    return recognize::recognize(automaton_, input);
}

bool Expression::is_match(std::string_view input) const {
    return recognize(input).accepted;
}

tree::SyntaxTree parse_syntax_tree(std::string_view pattern) {
    return tree::parse(pattern);
}

dfa::Automaton build_full_automaton(std::string_view pattern) {
    const auto syntax_tree = tree::parse(pattern);
    return full_automaton(syntax_tree, nfa::from_tree(syntax_tree));
}

dfa::Automaton build_optimal_automaton(std::string_view pattern) {
    return dfa::from_followpos(tree::annotate(tree::parse(pattern)));
}

recognize::RecognitionTrace recognize_string(const dfa::Automaton& automaton,
                                             std::string_view input) {
    return recognize::recognize(automaton, input);
}

bool match(std::string_view pattern, std::string_view input) {
    return Expression(pattern).is_match(input);
}

}  // namespace redfa
