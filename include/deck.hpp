/**
 * Rummy Engine - Deck Management
 *
 * Deck construction, dealing, wild-joker selection and draw-pile refill.
 * These are the mutators a game controller calls between engine queries.
 */

#pragma once

#include "pile.hpp"
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

namespace rummy {

/**
 * DealResult - Everything a new round starts from.
 */
struct DealResult {
    std::unordered_map<PlayerID, std::vector<Card>> hands;
    Pile draw_pile;
    Pile discard_pile;
    std::optional<Card> wild_joker_card;   // The cut card that names the wild rank
    Rank wild_rank = Rank::ACE;
};

/**
 * Number of 52-card decks for a table: one for two players, two otherwise.
 */
int decks_for_players(int player_count);

/**
 * Build the unshuffled card set for a table. Every deck contributes 52
 * standard cards and PRINTED_JOKERS_PER_DECK printed jokers. Ids are unique
 * across decks ("d0-10H", "d1-JKR1").
 */
std::vector<Card> create_decks(int player_count);

/**
 * Shuffle a card vector in place.
 */
template<typename RNG>
void shuffle_cards(std::vector<Card>& cards, RNG& rng) {
    std::shuffle(cards.begin(), cards.end(), rng);
}

/**
 * Deal a round from an already shuffled deck.
 *
 * Cards go out one at a time round-robin, then the next card is cut to pick
 * the wild rank (a cut printed joker makes Aces wild). The cut card goes to
 * the bottom of the draw pile and the next card starts the discard pile.
 * Every card of the wild rank is re-tagged JokerType::WILD.
 *
 * Returns nullopt if the deck cannot cover the hands plus cut and discard.
 */
std::optional<DealResult> deal_cards(const std::vector<Card>& deck,
                                     const std::vector<PlayerID>& player_ids,
                                     int cards_per_player = CARDS_PER_PLAYER);

/**
 * Tag every natural card of the wild rank as a wild joker.
 */
std::vector<Card> apply_wild_rank(const std::vector<Card>& cards, Rank wild_rank);

/**
 * When the draw pile runs out: keep the top discard, shuffle the rest of
 * the discard pile into a new draw pile. Returns false if there was nothing
 * to move.
 */
template<typename RNG>
bool refill_draw_pile(Pile& draw_pile, Pile& discard_pile, RNG& rng) {
    if (discard_pile.count() <= 1) {
        return false;
    }

    auto top = discard_pile.draw_top();
    for (auto& card : discard_pile.cards) {
        draw_pile.add_to_bottom(std::move(card));
    }
    discard_pile.cards.clear();
    discard_pile.add_to_top(std::move(*top));

    draw_pile.shuffle(rng);
    return true;
}

} // namespace rummy
