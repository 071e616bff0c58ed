/**
 * Rummy Engine - Hand Utilities Implementation
 */

#include "hand.hpp"
#include <algorithm>
#include <unordered_set>

namespace rummy {

int calculate_deadwood_points(const std::vector<Card>& cards) {
    int total = 0;
    for (const auto& card : cards) {
        total += card.is_joker() ? 0 : card.value;
    }
    return total;
}

Hand add_card_to_hand(const Hand& hand, const Card& card) {
    Hand result = hand;
    if (card.is_well_formed()) {
        result.push_back(card);
    }
    return result;
}

Hand remove_card_from_hand(const Hand& hand, const CardID& card_id) {
    Hand result;
    result.reserve(hand.size());
    bool removed = false;
    for (const auto& card : hand) {
        if (!removed && card.id == card_id) {
            removed = true;
            continue;
        }
        result.push_back(card);
    }
    return result;
}

const Card* find_card(const Hand& hand, const CardID& card_id) {
    for (const auto& card : hand) {
        if (card.id == card_id) {
            return &card;
        }
    }
    return nullptr;
}

Hand sort_hand(const Hand& hand) {
    Hand sorted = hand;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Card& a, const Card& b) {
        if (a.is_joker() != b.is_joker()) {
            return !a.is_joker();
        }
        if (a.suit != b.suit) {
            return a.suit < b.suit;
        }
        return a.rank < b.rank;
    });
    return sorted;
}

std::vector<Card> filter_valid_cards(const std::vector<Card>& cards) {
    std::vector<Card> result;
    result.reserve(cards.size());
    std::unordered_set<CardID> seen;
    for (const auto& card : cards) {
        if (!card.is_well_formed()) continue;
        if (!seen.insert(card.id).second) continue;
        result.push_back(card);
    }
    return result;
}

std::vector<Card> exclude_cards(const std::vector<Card>& cards, const std::vector<Card>& used) {
    std::unordered_set<CardID> used_ids;
    for (const auto& card : used) {
        used_ids.insert(card.id);
    }
    std::vector<Card> result;
    result.reserve(cards.size());
    for (const auto& card : cards) {
        if (used_ids.find(card.id) == used_ids.end()) {
            result.push_back(card);
        }
    }
    return result;
}

} // namespace rummy
