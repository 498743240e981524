#include <gtest/gtest.h>
#include <set>
#include <vector>
#include "from_postfix.hpp"
#include "from_tree.hpp"
#include "nfa.hpp"

namespace redfa::nfa {
namespace {

NFA build(const char* pattern) {
    return from_tree(tree::parse(pattern));
}

std::size_t count_epsilon(const NFA& nfa) {
    std::size_t count = 0;
    for (const auto& state : nfa.states) {
        for (const auto& trans : state) {
            if (std::holds_alternative<EpsilonTransition>(trans.condition)) {
                ++count;
            }
        }
    }
    return count;
}

TEST(NFAFromTree, LeafIsTwoStatesAndOneEdge) {
    const auto nfa = build("a");

    ASSERT_EQ(nfa.states.size(), 2u);
    EXPECT_EQ(nfa.start_state, 0u);
    EXPECT_EQ(nfa.accept_state, 1u);
    ASSERT_EQ(nfa.states[0].size(), 1u);
    EXPECT_EQ(nfa.states[0][0], (Transition{'a', 1}));
}

TEST(NFAFromTree, ConcatenationLinksAcceptToStart) {
    const auto nfa = build("ab");

    ASSERT_EQ(nfa.states.size(), 4u);
    EXPECT_EQ(nfa.states[1][0], (Transition{EpsilonTransition{}, 2}));
    EXPECT_EQ(nfa.start_state, 0u);
    EXPECT_EQ(nfa.accept_state, 3u);
}

TEST(NFAFromTree, UnionForksAndJoins) {
    const auto nfa = build("a|b");

    ASSERT_EQ(nfa.states.size(), 6u);
    EXPECT_EQ(nfa.start_state, 4u);
    EXPECT_EQ(nfa.accept_state, 5u);
    EXPECT_EQ(nfa.states[4],
              (std::vector<Transition>{{EpsilonTransition{}, 0},
                                       {EpsilonTransition{}, 2}}));
    EXPECT_EQ(count_epsilon(nfa), 4u);
}

TEST(NFAFromTree, StarHasBypassAndBackEdge) {
    const auto nfa = build("a*");

    EXPECT_EQ(nfa.start_state, 2u);
    EXPECT_EQ(nfa.accept_state, 3u);
    EXPECT_EQ(count_epsilon(nfa), 4u);
    EXPECT_EQ(epsilon_closure<std::set>(nfa, std::vector<StateID>{2}),
              (std::set<StateID>{0, 2, 3}));
}

TEST(NFAFromTree, PlusHasNoBypass) {
    const auto nfa = build("a+");

    EXPECT_EQ(nfa.states[nfa.start_state].size(), 1u);
    EXPECT_EQ(count_epsilon(nfa), 3u);
    EXPECT_FALSE(epsilon_closure<std::set>(
                     nfa, std::vector<StateID>{nfa.start_state})
                     .contains(nfa.accept_state));
}

TEST(NFAFromTree, OptionalHasNoBackEdge) {
    const auto nfa = build("a?");

    EXPECT_EQ(nfa.states[1],
              (std::vector<Transition>{{EpsilonTransition{}, 3}}));
    EXPECT_EQ(count_epsilon(nfa), 3u);
    EXPECT_TRUE(epsilon_closure<std::set>(
                    nfa, std::vector<StateID>{nfa.start_state})
                    .contains(nfa.accept_state));
}

TEST(NFAFromTree, SingleStartAndAcceptWithoutEndMarker) {
    const auto nfa = build("(a|b)*abb");

    EXPECT_TRUE(nfa.states[nfa.accept_state].empty());
    for (const auto& state : nfa.states) {
        for (const auto& trans : state) {
            EXPECT_NE(trans.target, nfa.start_state);
            if (const auto* c = std::get_if<char>(&trans.condition)) {
                EXPECT_NE(*c, '#');
            }
        }
    }
}

TEST(NFAFromTree, MoveFollowsOnlyMatchingSymbols) {
    const auto nfa = build("a|b");

    EXPECT_EQ(move_on<std::set>(nfa, std::set<StateID>{0, 2}, 'a'),
              (std::set<StateID>{1}));
    EXPECT_TRUE(move_on<std::set>(nfa, std::set<StateID>{0, 2}, 'c').empty());
}

TEST(EpsilonClosure, TerminatesOnCycles) {
    NFA nfa;
    const auto s0 = nfa.create_state();
    const auto s1 = nfa.create_state();
    const auto s2 = nfa.create_state();
    nfa.add_transition(s0, EpsilonTransition{}, s1);
    nfa.add_transition(s1, EpsilonTransition{}, s0);
    nfa.add_transition(s1, 'x', s2);

    EXPECT_EQ(epsilon_closure<std::set>(nfa, std::vector<StateID>{s0}),
              (std::set<StateID>{s0, s1}));
}

TEST(NFAFromTree, RejectsEmptyTree) {
    EXPECT_THROW(from_tree(tree::SyntaxTree{}), BuildError);
}

TEST(NFAStatistics, UnionHasEpsilonMovesAndIsNotDeterministic) {
    const auto nfa = build("a|b");
    const auto stats = statistics(nfa);

    EXPECT_EQ(stats.states, 6u);
    EXPECT_EQ(stats.transitions, 6u);
    EXPECT_EQ(stats.epsilon_transitions, count_epsilon(nfa));
    EXPECT_EQ(stats.epsilon_transitions, 4u);
    EXPECT_TRUE(stats.has_epsilon_transitions);
    EXPECT_FALSE(stats.deterministic);
    EXPECT_EQ(stats.significant_states, 3u);
}

TEST(NFAStatistics, SignificantStatesAreLeafStartsAndAccept) {
    const auto nfa = build("a|b");

    EXPECT_EQ(significant_states(nfa),
              (std::set<StateID>{0, 2, nfa.accept_state}));
}

TEST(NFAStatistics, SymbolOnlyChainIsDeterministic) {
    NFA nfa;
    const auto s0 = nfa.create_state();
    const auto s1 = nfa.create_state();
    const auto s2 = nfa.create_state();
    nfa.add_transition(s0, 'a', s1);
    nfa.add_transition(s0, 'b', s2);
    nfa.accept_state = s2;

    EXPECT_TRUE(is_deterministic(nfa));
    EXPECT_FALSE(statistics(nfa).has_epsilon_transitions);

    nfa.add_transition(s0, 'a', s2);
    EXPECT_FALSE(is_deterministic(nfa));
}

}  // namespace
}  // namespace redfa::nfa
