/**
 * Rummy Engine - Meld Validator
 *
 * Classifies a group of cards as pure sequence, sequence, set, or nothing.
 * Never throws: a group that is not a meld yields false / nullopt and the
 * caller treats its cards as deadwood.
 */

#pragma once

#include "card.hpp"
#include <optional>
#include <vector>

namespace rummy {

/**
 * Meld - A group of cards claimed to form a sequence or set.
 *
 * Computed from a hand snapshot; never stored independently.
 * is_pure is true iff no joker stands in for a missing card.
 */
struct Meld {
    MeldType type = MeldType::SET;
    std::vector<Card> cards;
    bool is_pure = false;

    Meld() = default;

    Meld(MeldType type_, std::vector<Card> cards_)
        : type(type_)
        , cards(std::move(cards_))
        , is_pure(type_ == MeldType::PURE_SEQUENCE)
    {}

    bool is_sequence() const { return is_sequence_type(type); }
    bool is_set() const { return type == MeldType::SET; }
    int size() const { return static_cast<int>(cards.size()); }
};

/**
 * Consecutive same-suit run of 3+ cards with no joker substituting.
 * A wild joker sitting at its own natural rank and suit counts as natural.
 */
bool is_pure_sequence(const std::vector<Card>& cards);

/**
 * Consecutive same-suit run of 3+ cards, jokers filling gaps or extending
 * either end. Ace is low only: A-2-3 is valid, Q-K-A and K-A-2 are not.
 * Pure sequences also satisfy this.
 */
bool is_valid_sequence(const std::vector<Card>& cards);

/**
 * 3-4 cards of one rank with distinct suits among the natural cards;
 * jokers stand in for the missing suits.
 */
bool is_valid_set(const std::vector<Card>& cards);

/**
 * Classify a group. Checks pure sequence, then sequence, then set.
 */
std::optional<MeldType> get_meld_type(const std::vector<Card>& cards);

/**
 * Check a meld against its claimed type. A pure run claimed as a plain
 * SEQUENCE is accepted; an impure run claimed as PURE_SEQUENCE is not.
 */
bool validate_meld(const Meld& meld);

/**
 * Build a meld from cards if they form one. Sequence cards are returned in
 * run order with jokers placed in the positions they fill.
 */
std::optional<Meld> create_meld(const std::vector<Card>& cards);

/**
 * Build a meld with an explicit type (as a player arranged it). The type is
 * not checked here; validate_meld() does that.
 */
Meld make_meld(MeldType type, std::vector<Card> cards);

int count_jokers(const std::vector<Card>& cards);

} // namespace rummy
