/**
 * Shared builders for engine tests.
 *
 * Cards are written as labels: "7H", "10S", "QC", "AD". Ids follow the deck
 * builder's scheme ("d0-7H") so hands read the same as dealt ones.
 */

#pragma once

#include "rummy_engine.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace test_helpers {

using namespace rummy;

inline Card card(const std::string& label, int deck = 0) {
    auto suit = parse_suit(label.substr(label.size() - 1));
    auto rank = parse_rank(label.substr(0, label.size() - 1));
    if (!suit.has_value() || !rank.has_value()) {
        throw std::runtime_error("Bad card label in test: " + label);
    }
    return Card::make("d" + std::to_string(deck) + "-" + label, *suit, *rank);
}

// Card of the wild rank, tagged as a wild joker
inline Card wild(const std::string& label, int deck = 0) {
    return card(label, deck).with_joker_type(JokerType::WILD);
}

inline Card joker(int n, int deck = 0) {
    return Card::printed_joker("d" + std::to_string(deck) + "-JKR" + std::to_string(n));
}

inline std::vector<Card> cards(std::initializer_list<const char*> labels) {
    std::vector<Card> out;
    for (const char* label : labels) {
        out.push_back(card(label));
    }
    return out;
}

inline std::vector<Card> concat(std::vector<Card> a, const std::vector<Card>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

inline int count_type(const std::vector<Meld>& melds, MeldType type) {
    int n = 0;
    for (const auto& meld : melds) {
        if (meld.type == type) n++;
    }
    return n;
}

inline bool has_id(const std::vector<Card>& hand, const CardID& id) {
    return find_card(hand, id) != nullptr;
}

} // namespace test_helpers
