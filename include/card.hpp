/**
 * Rummy Engine - Card
 *
 * Represents one physical card. Cards are created when the deck is built
 * and never change afterwards; moving a card between hand and piles copies
 * the value, and re-tagging a wild joker produces a new Card.
 */

#pragma once

#include "types.hpp"
#include <utility>

namespace rummy {

/**
 * Point value of a card: A = 1, 2-10 face value, J/Q/K = 10, any joker = 0.
 */
inline int card_value(Rank rank, JokerType joker_type) {
    if (joker_type != JokerType::NONE) {
        return 0;
    }
    int r = rank_index(rank);
    return r >= rank_index(Rank::TEN) ? 10 : r;
}

/**
 * Card - A physical playing card.
 *
 * Two cards may share suit and rank (multi-deck games) but never share id.
 * Printed jokers carry a placeholder suit/rank that the meld rules ignore.
 */
struct Card {
    // Identity
    CardID id;
    Suit suit = Suit::SPADES;
    Rank rank = Rank::ACE;
    JokerType joker_type = JokerType::NONE;

    // Derived from rank and joker_type at construction
    int value = 0;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Card() = default;

    Card(CardID id_, Suit suit_, Rank rank_, JokerType joker_type_ = JokerType::NONE)
        : id(std::move(id_))
        , suit(suit_)
        , rank(rank_)
        , joker_type(joker_type_)
        , value(card_value(rank_, joker_type_))
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static Card make(const CardID& id, Suit suit, Rank rank) {
        return Card(id, suit, rank, JokerType::NONE);
    }

    static Card printed_joker(const CardID& id) {
        return Card(id, Suit::SPADES, Rank::ACE, JokerType::PRINTED);
    }

    // Copy of this card with a different joker tag (value recomputed)
    Card with_joker_type(JokerType type) const {
        return Card(id, suit, rank, type);
    }

    // ========================================================================
    // QUERIES
    // ========================================================================

    bool is_joker() const { return joker_type != JokerType::NONE; }
    bool is_printed_joker() const { return joker_type == JokerType::PRINTED; }
    bool is_wild_joker() const { return joker_type == JokerType::WILD; }

    /**
     * Whether the card carries usable data. Cards built from untrusted input
     * (JSON, bindings) may lack an id or hold out-of-range enums; the engine
     * drops those instead of failing.
     */
    bool is_well_formed() const {
        int r = rank_index(rank);
        return !id.empty()
            && static_cast<int>(suit) < SUIT_COUNT
            && r >= rank_index(Rank::ACE) && r <= rank_index(Rank::KING)
            && static_cast<int>(joker_type) <= static_cast<int>(JokerType::WILD);
    }

    bool operator==(const Card& other) const {
        return id == other.id && suit == other.suit && rank == other.rank
            && joker_type == other.joker_type;
    }

    bool operator!=(const Card& other) const { return !(*this == other); }
};

/**
 * Short label for logs and the console: "10H", "QS", "JKR", "7D*" (wild).
 */
inline std::string card_label(const Card& card) {
    if (card.is_printed_joker()) {
        return "JKR";
    }
    static const char suit_codes[] = {'S', 'H', 'D', 'C'};
    std::string label = to_string(card.rank);
    int s = static_cast<int>(card.suit);
    label += (s >= 0 && s < SUIT_COUNT) ? suit_codes[s] : '?';
    if (card.is_wild_joker()) {
        label += '*';
    }
    return label;
}

} // namespace rummy
