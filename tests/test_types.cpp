/**
 * Tests for Core Types and Card Model
 */

#include "test_helpers.hpp"

using namespace rummy;
using namespace test_helpers;

// ============================================================================
// ENUM TEXT
// ============================================================================

TEST(Types, ToStringSpellings) {
    TEST_ASSERT_EQ(std::string("pool201"), std::string(to_string(Variant::POOL_201)));
    TEST_ASSERT_EQ(std::string("pure-sequence"), std::string(to_string(MeldType::PURE_SEQUENCE)));
    TEST_ASSERT_EQ(std::string("drop-first"), std::string(to_string(RoundOutcome::FIRST_DROP)));
    TEST_ASSERT_EQ(std::string("10"), std::string(to_string(Rank::TEN)));
}

TEST(Types, ParseIsCaseInsensitive) {
    TEST_ASSERT_TRUE(parse_variant("POOL101") == Variant::POOL_101);
    TEST_ASSERT_TRUE(parse_difficulty("Hard") == BotDifficulty::HARD);
    TEST_ASSERT_TRUE(parse_rank("q") == Rank::QUEEN);
    TEST_ASSERT_TRUE(parse_rank("T") == Rank::TEN);
}

TEST(Types, ParseSuitCodes) {
    TEST_ASSERT_TRUE(parse_suit("H") == Suit::HEARTS);
    TEST_ASSERT_TRUE(parse_suit("c") == Suit::CLUBS);
    TEST_ASSERT_TRUE(parse_suit("spades") == Suit::SPADES);
}

TEST(Types, ParseUnknownIsNullopt) {
    TEST_ASSERT_FALSE(parse_variant("gin").has_value());
    TEST_ASSERT_FALSE(parse_suit("X").has_value());
    TEST_ASSERT_FALSE(parse_rank("14").has_value());
    TEST_ASSERT_FALSE(parse_round_outcome("").has_value());
}

TEST(Types, PoolLimits) {
    TEST_ASSERT_EQ(101, pool_limit(Variant::POOL_101).value());
    TEST_ASSERT_EQ(201, pool_limit(Variant::POOL_201).value());
    TEST_ASSERT_FALSE(pool_limit(Variant::DEALS).has_value());
}

// ============================================================================
// CARD
// ============================================================================

TEST(Card, ValuesFollowRank) {
    TEST_ASSERT_EQ(1, card("AS").value);
    TEST_ASSERT_EQ(7, card("7H").value);
    TEST_ASSERT_EQ(10, card("10D").value);
    TEST_ASSERT_EQ(10, card("KC").value);
}

TEST(Card, JokersAreWorthNothing) {
    TEST_ASSERT_EQ(0, joker(1).value);
    TEST_ASSERT_EQ(0, wild("KH").value);
    TEST_ASSERT_TRUE(wild("KH").is_joker());
    TEST_ASSERT_TRUE(joker(1).is_printed_joker());
}

TEST(Card, Labels) {
    TEST_ASSERT_EQ(std::string("10H"), card_label(card("10H")));
    TEST_ASSERT_EQ(std::string("JKR"), card_label(joker(2)));
    TEST_ASSERT_EQ(std::string("5D*"), card_label(wild("5D")));
}

TEST(Card, DefaultCardIsMalformed) {
    Card blank;
    TEST_ASSERT_FALSE(blank.is_well_formed());
    TEST_ASSERT_TRUE(card("2C").is_well_formed());
}

// ============================================================================
// HAND
// ============================================================================

TEST(Hand, DeadwoodPointsIgnoreJokers) {
    std::vector<Card> hand = concat(cards({"KS", "5H", "AD"}), {joker(1), wild("9C")});
    TEST_ASSERT_EQ(16, calculate_deadwood_points(hand));
}

TEST(Hand, RemoveTakesOneCopyById) {
    std::vector<Card> hand = cards({"3S", "4S", "5S"});
    std::vector<Card> after = remove_card_from_hand(hand, "d0-4S");
    TEST_ASSERT_EQ(2u, after.size());
    TEST_ASSERT_FALSE(has_id(after, "d0-4S"));
    TEST_ASSERT_EQ(3u, remove_card_from_hand(hand, "missing").size());
}

TEST(Hand, AddIgnoresMalformedCards) {
    std::vector<Card> hand = cards({"3S"});
    TEST_ASSERT_EQ(1u, add_card_to_hand(hand, Card()).size());
    TEST_ASSERT_EQ(2u, add_card_to_hand(hand, card("9D")).size());
}

TEST(Hand, SortPutsJokersLast) {
    std::vector<Card> hand = {joker(1), card("5C"), card("2S"), card("KH"), card("3S")};
    std::vector<Card> sorted = sort_hand(hand);
    TEST_ASSERT_EQ(std::string("d0-2S"), sorted[0].id);
    TEST_ASSERT_EQ(std::string("d0-3S"), sorted[1].id);
    TEST_ASSERT_EQ(std::string("d0-KH"), sorted[2].id);
    TEST_ASSERT_EQ(std::string("d0-5C"), sorted[3].id);
    TEST_ASSERT_TRUE(sorted[4].is_printed_joker());
}

TEST(Hand, FilterDropsDuplicatesAndBlanks) {
    std::vector<Card> hand = {card("3S"), Card(), card("3S"), card("4S")};
    TEST_ASSERT_EQ(2u, filter_valid_cards(hand).size());
}
