/**
 * Rummy Engine - Pile Container
 *
 * Ordered stack of cards used for the draw pile and the discard pile.
 * The top of the pile is the back of the vector.
 */

#pragma once

#include "card.hpp"
#include <algorithm>
#include <optional>
#include <random>
#include <vector>

namespace rummy {

/**
 * Pile - Ordered container for cards.
 */
struct Pile {
    std::vector<Card> cards;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Pile() = default;

    explicit Pile(std::vector<Card> cards_)
        : cards(std::move(cards_))
    {}

    // ========================================================================
    // BASIC OPERATIONS
    // ========================================================================

    void add_to_top(Card card) {
        cards.push_back(std::move(card));
    }

    void add_to_bottom(Card card) {
        cards.insert(cards.begin(), std::move(card));
    }

    // Remove and return the top card
    std::optional<Card> draw_top() {
        if (cards.empty()) {
            return std::nullopt;
        }
        Card top = std::move(cards.back());
        cards.pop_back();
        return top;
    }

    // Peek at top card without removing
    const Card* peek_top() const {
        if (cards.empty()) {
            return nullptr;
        }
        return &cards.back();
    }

    // Remove and return a specific card
    std::optional<Card> take_card(const CardID& card_id) {
        for (auto it = cards.begin(); it != cards.end(); ++it) {
            if (it->id == card_id) {
                Card removed = std::move(*it);
                cards.erase(it);
                return removed;
            }
        }
        return std::nullopt;
    }

    const Card* find_card(const CardID& card_id) const {
        for (const auto& card : cards) {
            if (card.id == card_id) {
                return &card;
            }
        }
        return nullptr;
    }

    int count() const {
        return static_cast<int>(cards.size());
    }

    bool is_empty() const {
        return cards.empty();
    }

    template<typename RNG>
    void shuffle(RNG& rng) {
        std::shuffle(cards.begin(), cards.end(), rng);
    }
};

} // namespace rummy
