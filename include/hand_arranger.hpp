/**
 * Rummy Engine - Hand Arranger
 *
 * Best-effort partition of a hand into melds plus deadwood, favouring an
 * arrangement that can be declared. The search is anchored on each pure
 * sequence the natural cards allow and stops at the first arrangement that
 * declares.
 */

#pragma once

#include "meld.hpp"
#include <vector>

namespace rummy {

/**
 * HandAnalysis - Result of arranging a hand.
 *
 * melds + deadwood always hold every well-formed input card exactly once.
 */
struct HandAnalysis {
    std::vector<Meld> melds;
    std::vector<Card> deadwood;
    int deadwood_points = 0;
    bool has_pure_sequence = false;
    int sequence_count = 0;
    bool can_declare = false;

    /**
     * All arranged cards, melds first then deadwood.
     */
    std::vector<Card> all_cards() const;
};

/**
 * Arrange a hand. Never fails: worst case is no melds and the whole hand
 * as deadwood. Malformed and duplicate-id cards are dropped.
 */
HandAnalysis auto_arrange_hand(const std::vector<Card>& cards);

/**
 * Every pure run of length >= 3 in the natural cards, including each
 * sub-run of a longer run. Exposed for the bot and tests.
 */
std::vector<std::vector<Card>> find_all_pure_sequences(const std::vector<Card>& cards);

/**
 * Same-rank groups of 3-4 distinct suits among natural cards.
 */
std::vector<std::vector<Card>> find_sets(const std::vector<Card>& cards);

} // namespace rummy
