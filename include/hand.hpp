/**
 * Rummy Engine - Hand Utilities
 *
 * Helpers over plain card vectors. The engine never owns hand storage:
 * every function takes a snapshot and returns a new vector.
 */

#pragma once

#include "card.hpp"
#include <vector>

namespace rummy {

using Hand = std::vector<Card>;

inline bool is_joker(const Card& card) {
    return card.is_joker();
}

/**
 * Sum of card values. Jokers contribute 0.
 */
int calculate_deadwood_points(const std::vector<Card>& cards);

/**
 * Append a card (ignored if malformed).
 */
Hand add_card_to_hand(const Hand& hand, const Card& card);

/**
 * Remove the card with the given id. Returns the hand unchanged if the id
 * is not present.
 */
Hand remove_card_from_hand(const Hand& hand, const CardID& card_id);

/**
 * Find a card by id. Returns nullptr if not present.
 */
const Card* find_card(const Hand& hand, const CardID& card_id);

/**
 * Sort by suit then rank, jokers last.
 */
Hand sort_hand(const Hand& hand);

/**
 * Drop malformed cards and later duplicates of an id already seen.
 */
std::vector<Card> filter_valid_cards(const std::vector<Card>& cards);

/**
 * Cards of `cards` whose id does not appear in `used`.
 */
std::vector<Card> exclude_cards(const std::vector<Card>& cards, const std::vector<Card>& used);

} // namespace rummy
