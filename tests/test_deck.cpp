/**
 * Tests for Deck Management
 */

#include "test_helpers.hpp"
#include <set>

using namespace rummy;
using namespace test_helpers;

// ============================================================================
// DECK CONSTRUCTION
// ============================================================================

TEST(Deck, OneDeckForTwoPlayers) {
    TEST_ASSERT_EQ(1, decks_for_players(2));
    TEST_ASSERT_EQ(2, decks_for_players(3));
    TEST_ASSERT_EQ(2, decks_for_players(6));

    auto deck = create_decks(2);
    TEST_ASSERT_EQ(54u, deck.size());
    TEST_ASSERT_EQ(2, count_jokers(deck));
}

TEST(Deck, IdsUniqueAcrossDecks) {
    auto deck = create_decks(3);
    TEST_ASSERT_EQ(108u, deck.size());

    std::set<CardID> ids;
    for (const auto& card : deck) {
        ids.insert(card.id);
    }
    TEST_ASSERT_EQ(108u, ids.size());
    TEST_ASSERT_TRUE(ids.count("d1-10H") == 1);
    TEST_ASSERT_TRUE(ids.count("d1-JKR2") == 1);
}

TEST(Deck, ApplyWildRankTagsNaturalsOnly) {
    std::vector<Card> hand = {card("7H"), card("7C"), card("8H"), joker(1)};
    auto tagged = apply_wild_rank(hand, Rank::SEVEN);

    TEST_ASSERT_TRUE(tagged[0].is_wild_joker());
    TEST_ASSERT_TRUE(tagged[1].is_wild_joker());
    TEST_ASSERT_FALSE(tagged[2].is_joker());
    TEST_ASSERT_TRUE(tagged[3].is_printed_joker());
    TEST_ASSERT_EQ(0, tagged[0].value);
}

// ============================================================================
// DEALING
// ============================================================================

TEST(Deck, DealThreePlayers) {
    std::mt19937 rng(11);
    auto deck = create_decks(3);
    shuffle_cards(deck, rng);

    auto deal = deal_cards(deck, {"a", "b", "c"});
    TEST_ASSERT_TRUE(deal.has_value());
    TEST_ASSERT_EQ(13u, deal->hands["a"].size());
    TEST_ASSERT_EQ(13u, deal->hands["b"].size());
    TEST_ASSERT_EQ(13u, deal->hands["c"].size());
    TEST_ASSERT_EQ(68, deal->draw_pile.count());
    TEST_ASSERT_EQ(1, deal->discard_pile.count());

    // Cut card sits at the bottom of the draw pile
    TEST_ASSERT_TRUE(deal->wild_joker_card.has_value());
    TEST_ASSERT_EQ(deal->wild_joker_card->id, deal->draw_pile.cards.front().id);
}

TEST(Deck, UnshuffledDealIsPredictable) {
    auto deck = create_decks(2);
    auto deal = deal_cards(deck, {"p0", "p1"});
    TEST_ASSERT_TRUE(deal.has_value());

    // 26 cards dealt; the 27th (Ace of diamonds) is cut
    TEST_ASSERT_EQ(std::string("d0-AD"), deal->wild_joker_card->id);
    TEST_ASSERT_TRUE(deal->wild_rank == Rank::ACE);

    const auto& p0 = deal->hands["p0"];
    TEST_ASSERT_EQ(std::string("d0-AS"), p0.front().id);
    TEST_ASSERT_TRUE(p0.front().is_wild_joker());

    TEST_ASSERT_EQ(std::string("d0-2D"), deal->discard_pile.peek_top()->id);
    TEST_ASSERT_EQ(std::string("d0-3D"), deal->draw_pile.peek_top()->id);
    TEST_ASSERT_EQ(std::string("d0-AD"), deal->draw_pile.cards.front().id);
    TEST_ASSERT_TRUE(deal->draw_pile.cards.front().is_wild_joker());
    TEST_ASSERT_EQ(27, deal->draw_pile.count());
}

TEST(Deck, PrintedJokerCutMakesAcesWild) {
    std::vector<Card> deck = {card("AS"), card("5H"), joker(1), card("7H"), card("AC")};
    auto deal = deal_cards(deck, {"p0", "p1"}, 1);
    TEST_ASSERT_TRUE(deal.has_value());

    TEST_ASSERT_TRUE(deal->wild_rank == Rank::ACE);
    TEST_ASSERT_TRUE(deal->wild_joker_card->is_printed_joker());
    TEST_ASSERT_TRUE(deal->hands["p0"].front().is_wild_joker());
    TEST_ASSERT_FALSE(deal->hands["p1"].front().is_joker());
    TEST_ASSERT_EQ(std::string("d0-7H"), deal->discard_pile.peek_top()->id);
    TEST_ASSERT_TRUE(deal->draw_pile.peek_top()->is_wild_joker());
    TEST_ASSERT_EQ(2, deal->draw_pile.count());
}

TEST(Deck, ShortDeckCannotDeal) {
    std::vector<Card> deck = cards({"AS", "2S", "3S"});
    TEST_ASSERT_FALSE(deal_cards(deck, {"p0", "p1"}, 1).has_value());
    TEST_ASSERT_FALSE(deal_cards(create_decks(2), {}).has_value());
}

// ============================================================================
// REFILL
// ============================================================================

TEST(Deck, RefillKeepsTopDiscard) {
    std::mt19937 rng(7);
    Pile draw_pile;
    Pile discard_pile(cards({"2S", "3S", "4S", "5S", "6S"}));

    TEST_ASSERT_TRUE(refill_draw_pile(draw_pile, discard_pile, rng));
    TEST_ASSERT_EQ(1, discard_pile.count());
    TEST_ASSERT_EQ(std::string("d0-6S"), discard_pile.peek_top()->id);
    TEST_ASSERT_EQ(4, draw_pile.count());
    TEST_ASSERT_NULL(draw_pile.find_card("d0-6S"));
}

TEST(Deck, RefillNeedsMoreThanTopCard) {
    std::mt19937 rng(7);
    Pile draw_pile;
    Pile discard_pile(cards({"9D"}));

    TEST_ASSERT_FALSE(refill_draw_pile(draw_pile, discard_pile, rng));
    TEST_ASSERT_EQ(1, discard_pile.count());
    TEST_ASSERT_TRUE(draw_pile.is_empty());
}
