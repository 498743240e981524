#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "from_followpos.hpp"
#include "from_nfa.hpp"
#include "from_postfix.hpp"
#include "from_tree.hpp"
#include "recognizer.hpp"

namespace redfa::recognize {
namespace {

dfa::Automaton short_automaton(const char* pattern) {
    return dfa::from_followpos(tree::annotate(tree::parse(pattern)));
}

dfa::Automaton full_automaton(const char* pattern) {
    const auto tree = tree::parse(pattern);
    return dfa::from_nfa(nfa::from_tree(tree), tree.alphabet);
}

TEST(Recognize, RecordsEveryTransitionOfAcceptedString) {
    const auto trace = recognize(short_automaton("ab"), "ab");

    EXPECT_TRUE(trace.accepted);
    EXPECT_EQ(trace.outcome, Outcome::accepted);
    EXPECT_EQ(trace.steps, (std::vector<Step>{{'a', 0, 1}, {'b', 1, 2}}));
    EXPECT_EQ(trace.final_state, 2u);
    EXPECT_EQ(trace.consumed, 2u);
    EXPECT_TRUE(trace.remaining.empty());
}

TEST(Recognize, RejectsWhenInputEndsEarly) {
    const auto trace = recognize(short_automaton("ab"), "a");

    EXPECT_FALSE(trace.accepted);
    EXPECT_EQ(trace.outcome, Outcome::rejected_in_non_accepting_state);
    EXPECT_EQ(trace.final_state, 1u);
}

TEST(Recognize, MissingTransitionStopsTrace) {
    const auto trace = recognize(short_automaton("ab"), "abb");

    EXPECT_FALSE(trace.accepted);
    EXPECT_EQ(trace.outcome, Outcome::no_transition);
    EXPECT_EQ(trace.steps.size(), 2u);
    EXPECT_EQ(trace.consumed, 2u);
    EXPECT_EQ(trace.remaining, "b");
    EXPECT_EQ(trace.final_state, 2u);
}

TEST(Recognize, UnknownSymbolIsRejectionNotError) {
    const auto trace = recognize(short_automaton("ab"), "axb");

    EXPECT_FALSE(trace.accepted);
    EXPECT_EQ(trace.outcome, Outcome::unknown_symbol);
    EXPECT_EQ(trace.steps, (std::vector<Step>{{'a', 0, 1}}));
    EXPECT_EQ(trace.remaining, "xb");
}

TEST(Recognize, DeadStateEndsTraceAfterRecordingStep) {
    const auto dfa = full_automaton("ab");
    const auto trace = recognize(dfa, "bab");

    EXPECT_FALSE(trace.accepted);
    EXPECT_EQ(trace.outcome, Outcome::entered_dead_state);
    EXPECT_EQ(trace.steps, (std::vector<Step>{{'b', 0, *dfa.dead_state}}));
    EXPECT_EQ(trace.final_state, *dfa.dead_state);
    EXPECT_EQ(trace.remaining, "ab");
}

TEST(Recognize, EmptyInputDependsOnStartState) {
    EXPECT_TRUE(recognize(short_automaton("a*"), "").accepted);
    EXPECT_FALSE(recognize(short_automaton("a+"), "").accepted);
    EXPECT_TRUE(recognize(short_automaton("a*"), "").steps.empty());
}

TEST(Recognize, HandAssembledAutomaton) {
    dfa::Automaton automaton;
    automaton.alphabet = {'0', '1'};
    const auto even = automaton.create_state({0}, true);
    const auto odd = automaton.create_state({1}, false);
    automaton.add_transition(even, '0', even);
    automaton.add_transition(even, '1', odd);
    automaton.add_transition(odd, '0', odd);
    automaton.add_transition(odd, '1', even);

    EXPECT_TRUE(recognize(automaton, "1001").accepted);
    EXPECT_FALSE(recognize(automaton, "10").accepted);
    EXPECT_EQ(recognize(automaton, "1001").steps.size(), 4u);
}

TEST(RecognizeNFA, TracksStateSets) {
    const auto tree = tree::parse("ab");
    const auto nfa = nfa::from_tree(tree);
    const auto trace = recognize(nfa, "ab");

    EXPECT_TRUE(trace.accepted);
    EXPECT_EQ(trace.initial, (StateSet{0}));
    ASSERT_EQ(trace.steps.size(), 2u);
    EXPECT_EQ(trace.steps[0].to, (StateSet{1, 2}));
    EXPECT_EQ(trace.steps[1].to, (StateSet{3}));
}

TEST(RecognizeNFA, EmptySetStopsTrace) {
    const auto nfa = nfa::from_tree(tree::parse("(a|b)*abb"));
    const auto trace = recognize(nfa, "abxb");

    EXPECT_FALSE(trace.accepted);
    EXPECT_EQ(trace.outcome, Outcome::no_transition);
    EXPECT_EQ(trace.consumed, 2u);
    EXPECT_EQ(trace.remaining, "xb");
}

TEST(RecognizeNFA, AgreesWithDFA) {
    const auto tree = tree::parse("(a|b)*abb");
    const auto nfa = nfa::from_tree(tree);
    const auto dfa = dfa::from_nfa(nfa, tree.alphabet);

    for (const char* input : {"abb", "aabb", "babb", "ab", "", "abba"}) {
        EXPECT_EQ(recognize(nfa, input).accepted,
                  recognize(dfa, input).accepted)
            << input;
    }
}

TEST(Recognize, TraceDump) {
    const auto text = to_string(recognize(short_automaton("ab"), "abc"));

    EXPECT_EQ(text,
              "0 --a--> 1\n"
              "1 --b--> 2\n"
              "unconsumed: \"c\"\n"
              "rejected: symbol does not belong to the alphabet\n");
}

TEST(Recognize, EveryOutcomeIsDescribed) {
    for (auto outcome :
         {Outcome::accepted, Outcome::rejected_in_non_accepting_state,
          Outcome::no_transition, Outcome::unknown_symbol,
          Outcome::entered_dead_state}) {
        EXPECT_FALSE(describe(outcome).empty());
    }
}

TEST(AcceptedStrings, SingleWord) {
    EXPECT_EQ(accepted_strings(short_automaton("ab")),
              (std::vector<std::string>{"ab"}));
    EXPECT_EQ(accepted_strings(full_automaton("ab")),
              (std::vector<std::string>{"ab"}));
}

TEST(AcceptedStrings, ShortestFirstThenAlphabetOrder) {
    EXPECT_EQ(accepted_strings(short_automaton("(a|b)*abb"), 4),
              (std::vector<std::string>{"abb", "aabb", "babb"}));
}

TEST(AcceptedStrings, IncludesEmptyStringAndHonoursLimits) {
    const auto dfa = short_automaton("a*");

    EXPECT_EQ(accepted_strings(dfa, 3),
              (std::vector<std::string>{"", "a", "aa", "aaa"}));
    EXPECT_EQ(accepted_strings(dfa, 3, 2),
              (std::vector<std::string>{"", "a"}));
    EXPECT_TRUE(accepted_strings(dfa, 3, 0).empty());
}

TEST(AcceptedStrings, EveryStringIsAccepted) {
    const auto dfa = full_automaton("(ab|a)*(b|c)?");

    for (const auto& input : accepted_strings(dfa, 4)) {
        EXPECT_TRUE(recognize(dfa, input).accepted) << input;
    }
}

TEST(ValidateStrings, OneTracePerInput) {
    const auto dfa = short_automaton("ab");
    const auto results = validate_strings(dfa, {"ab", "a", "abc", ""});

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].input, "ab");
    EXPECT_TRUE(results[0].trace.accepted);
    EXPECT_EQ(results[1].trace.outcome,
              Outcome::rejected_in_non_accepting_state);
    EXPECT_EQ(results[2].trace.outcome, Outcome::unknown_symbol);
    EXPECT_FALSE(results[3].trace.accepted);
}

TEST(AcceptancePath, ListsVisitedStates) {
    const auto path = acceptance_path(short_automaton("ab"), "ab");

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, (std::vector<dfa::StateID>{0, 1, 2}));
}

TEST(AcceptancePath, EmptyInputIsJustTheStartState) {
    const auto path = acceptance_path(short_automaton("a*"), "");

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, (std::vector<dfa::StateID>{0}));
}

TEST(AcceptancePath, RejectedInputHasNoPath) {
    EXPECT_FALSE(acceptance_path(short_automaton("ab"), "a").has_value());
    EXPECT_FALSE(acceptance_path(full_automaton("ab"), "ba").has_value());
}

}  // namespace
}  // namespace redfa::recognize
