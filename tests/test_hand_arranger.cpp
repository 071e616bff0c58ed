/**
 * Tests for the Hand Arranger
 */

#include "test_helpers.hpp"
#include <algorithm>

using namespace rummy;
using namespace test_helpers;

namespace {

std::vector<Card> two_runs_two_pairs_two_jokers() {
    return concat(cards({"3S", "4S", "5S", "7H", "8H", "9H", "2C", "2D", "2S", "KC", "KD"}),
                  {joker(1), joker(2)});
}

std::vector<Card> one_impure_run_and_singles() {
    return concat(cards({"4H", "5H", "AS", "4S", "7S", "10S", "KS", "2C", "6C", "9C", "3D", "8D"}),
                  {joker(1)});
}

std::vector<CardID> sorted_ids(const std::vector<Card>& hand) {
    std::vector<CardID> ids;
    for (const auto& card : hand) ids.push_back(card.id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace

// ============================================================================
// SEARCH PRIMITIVES
// ============================================================================

TEST(HandArranger, FindsEverySubRun) {
    auto runs = find_all_pure_sequences(cards({"5C", "6C", "7C", "8C", "KH"}));
    // 5-8, 5-7, 6-8
    TEST_ASSERT_EQ(3u, runs.size());
    TEST_ASSERT_EQ(4u, runs[0].size());
}

TEST(HandArranger, RunsSkipJokers) {
    std::vector<Card> hand = {card("5C"), wild("6C"), card("7C")};
    TEST_ASSERT_TRUE(find_all_pure_sequences(hand).empty());
}

TEST(HandArranger, FindSetsNeedsThreeSuits) {
    auto sets = find_sets(cards({"9C", "9D", "9S", "4H", "4S"}));
    TEST_ASSERT_EQ(1u, sets.size());
    TEST_ASSERT_EQ(3u, sets[0].size());
}

// ============================================================================
// ARRANGEMENT
// ============================================================================

TEST(HandArranger, DeclarableHandWithJokerSets) {
    HandAnalysis analysis = auto_arrange_hand(two_runs_two_pairs_two_jokers());

    TEST_ASSERT_TRUE(analysis.can_declare);
    TEST_ASSERT_EQ(0, analysis.deadwood_points);
    TEST_ASSERT_TRUE(analysis.deadwood.empty());
    TEST_ASSERT_EQ(2, count_type(analysis.melds, MeldType::PURE_SEQUENCE));
    TEST_ASSERT_TRUE(count_type(analysis.melds, MeldType::SET) >= 1);
    TEST_ASSERT_TRUE(validate_declaration(analysis.melds).is_valid);
}

TEST(HandArranger, ImpureRunWithScatteredSingles) {
    HandAnalysis analysis = auto_arrange_hand(one_impure_run_and_singles());

    TEST_ASSERT_FALSE(analysis.has_pure_sequence);
    TEST_ASSERT_FALSE(analysis.can_declare);
    TEST_ASSERT_EQ(1, analysis.sequence_count);
    TEST_ASSERT_EQ(60, analysis.deadwood_points);
    TEST_ASSERT_EQ(10u, analysis.deadwood.size());
}

TEST(HandArranger, SplitsLongRunForSecondSequence) {
    std::vector<Card> hand = cards({"AS", "2S", "3S", "4S", "5S", "6S",
                                    "QC", "QD", "QS", "KC", "KD", "KH", "7D"});
    HandAnalysis analysis = auto_arrange_hand(hand);

    TEST_ASSERT_TRUE(analysis.has_pure_sequence);
    TEST_ASSERT_EQ(2, analysis.sequence_count);
    TEST_ASSERT_EQ(2, count_type(analysis.melds, MeldType::SET));
    TEST_ASSERT_EQ(7, analysis.deadwood_points);
    TEST_ASSERT_FALSE(analysis.can_declare);
}

TEST(HandArranger, SetsIgnoredWithOneSequence) {
    std::vector<Card> hand = cards({"3S", "4S", "5S", "QC", "QD", "QS", "KC", "KD", "KH",
                                    "7D", "9C", "2H", "8H"});
    HandAnalysis analysis = auto_arrange_hand(hand);

    TEST_ASSERT_EQ(1u, analysis.melds.size());
    TEST_ASSERT_EQ(1, analysis.sequence_count);
    TEST_ASSERT_EQ(86, analysis.deadwood_points);
}

TEST(HandArranger, SpareJokerJoinsCountedMeld) {
    std::vector<Card> hand = concat(cards({"AS", "2S", "3S", "4S", "5S", "6S",
                                           "8H", "9H", "10H", "QC", "QD", "QS"}),
                                    {joker(1)});
    HandAnalysis analysis = auto_arrange_hand(hand);

    TEST_ASSERT_TRUE(analysis.can_declare);
    TEST_ASSERT_TRUE(analysis.deadwood.empty());
}

TEST(HandArranger, EveryCardAccountedFor) {
    std::vector<std::vector<Card>> hands = {
        two_runs_two_pairs_two_jokers(),
        one_impure_run_and_singles(),
        cards({"AS", "2S", "3S", "4S", "5S", "6S", "QC", "QD", "QS", "KC", "KD", "KH", "7D"}),
    };

    for (const auto& hand : hands) {
        HandAnalysis analysis = auto_arrange_hand(hand);
        TEST_ASSERT_TRUE(sorted_ids(analysis.all_cards()) == sorted_ids(hand));
    }
}

TEST(HandArranger, RearrangingADeclarationStaysDeclarable) {
    HandAnalysis first = auto_arrange_hand(two_runs_two_pairs_two_jokers());
    HandAnalysis second = auto_arrange_hand(first.all_cards());

    TEST_ASSERT_TRUE(second.can_declare);
    TEST_ASSERT_EQ(0, second.deadwood_points);
}

TEST(HandArranger, InputOrderDoesNotMatter) {
    std::vector<Card> hand = one_impure_run_and_singles();
    std::vector<Card> reversed(hand.rbegin(), hand.rend());

    HandAnalysis a = auto_arrange_hand(hand);
    HandAnalysis b = auto_arrange_hand(reversed);
    TEST_ASSERT_EQ(a.deadwood_points, b.deadwood_points);
    TEST_ASSERT_EQ(a.sequence_count, b.sequence_count);
}

TEST(HandArranger, SecondDeckCopyStaysOutOfRun) {
    std::vector<Card> hand = {card("5H", 0), card("5H", 1), card("6H"), card("7H")};
    HandAnalysis analysis = auto_arrange_hand(hand);

    TEST_ASSERT_EQ(1u, analysis.melds.size());
    TEST_ASSERT_EQ(1u, analysis.deadwood.size());
    TEST_ASSERT_EQ(5, analysis.deadwood_points);
}

// ============================================================================
// DEGENERATE INPUT
// ============================================================================

TEST(HandArranger, EmptyHand) {
    HandAnalysis analysis = auto_arrange_hand({});
    TEST_ASSERT_TRUE(analysis.melds.empty());
    TEST_ASSERT_TRUE(analysis.deadwood.empty());
    TEST_ASSERT_FALSE(analysis.can_declare);
}

TEST(HandArranger, MalformedCardsFiltered) {
    std::vector<Card> hand = {Card(), card("3S"), card("4S"), card("5S")};
    HandAnalysis analysis = auto_arrange_hand(hand);

    TEST_ASSERT_EQ(1u, analysis.melds.size());
    TEST_ASSERT_TRUE(analysis.deadwood.empty());
    TEST_ASSERT_EQ(3u, analysis.all_cards().size());
}

TEST(HandArranger, NothingMeldsMeansWholeHandIsDeadwood) {
    std::vector<Card> hand = cards({"AS", "4S", "7S", "10S", "KS", "2C", "6C", "9C", "QC",
                                    "3D", "8D", "JD", "5H"});
    HandAnalysis analysis = auto_arrange_hand(hand);

    TEST_ASSERT_TRUE(analysis.melds.empty());
    TEST_ASSERT_EQ(13u, analysis.deadwood.size());
    TEST_ASSERT_EQ(85, analysis.deadwood_points);
}
