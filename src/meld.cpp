/**
 * Rummy Engine - Meld Validator Implementation
 *
 * Every check is tried under two readings of wild jokers:
 *   substitute - every joker-tagged card is a free substitute
 *   natural    - wild jokers play as their printed rank/suit, only printed
 *                jokers substitute
 * A group is a meld if either reading works.
 */

#include "meld.hpp"
#include <algorithm>

namespace rummy {

namespace {

struct Reading {
    std::vector<Card> naturals;
    std::vector<Card> jokers;
};

bool all_well_formed(const std::vector<Card>& cards) {
    return std::all_of(cards.begin(), cards.end(),
                       [](const Card& c) { return c.is_well_formed(); });
}

Reading substitute_reading(const std::vector<Card>& cards) {
    Reading reading;
    for (const auto& card : cards) {
        if (card.is_joker()) {
            reading.jokers.push_back(card);
        } else {
            reading.naturals.push_back(card);
        }
    }
    return reading;
}

Reading natural_reading(const std::vector<Card>& cards) {
    Reading reading;
    for (const auto& card : cards) {
        if (card.is_printed_joker()) {
            reading.jokers.push_back(card);
        } else {
            reading.naturals.push_back(card);
        }
    }
    return reading;
}

/**
 * First rank of the run the reading forms, or nullopt if it forms none.
 */
std::optional<int> run_start(const Reading& reading) {
    const auto& naturals = reading.naturals;
    if (naturals.empty()) {
        return std::nullopt;
    }

    int total = static_cast<int>(naturals.size() + reading.jokers.size());
    if (total < MIN_MELD_SIZE || total > RANK_COUNT) {
        return std::nullopt;
    }

    Suit suit = naturals.front().suit;
    int lo = RANK_COUNT + 1;
    int hi = 0;
    bool seen[RANK_COUNT + 1] = {false};

    for (const auto& card : naturals) {
        if (card.suit != suit) {
            return std::nullopt;
        }
        int r = rank_index(card.rank);
        if (seen[r]) {
            return std::nullopt;
        }
        seen[r] = true;
        lo = std::min(lo, r);
        hi = std::max(hi, r);
    }

    // Jokers must cover the internal gaps; the rest extend the ends.
    int span = hi - lo + 1;
    if (span > total) {
        return std::nullopt;
    }

    // Extend upward first, then downward once King is reached.
    return std::max(rank_index(Rank::ACE), std::min(lo, RANK_COUNT - total + 1));
}

bool forms_set(const Reading& reading) {
    const auto& naturals = reading.naturals;
    if (naturals.empty()) {
        return false;
    }

    size_t total = naturals.size() + reading.jokers.size();
    if (total < static_cast<size_t>(MIN_MELD_SIZE) || total > static_cast<size_t>(MAX_SET_SIZE)) {
        return false;
    }

    Rank rank = naturals.front().rank;
    bool suits[SUIT_COUNT] = {false};
    for (const auto& card : naturals) {
        if (card.rank != rank) {
            return false;
        }
        int s = static_cast<int>(card.suit);
        if (suits[s]) {
            return false;
        }
        suits[s] = true;
    }
    return true;
}

std::vector<Card> order_run(const Reading& reading, int start) {
    std::vector<Card> naturals = reading.naturals;
    std::sort(naturals.begin(), naturals.end(), [](const Card& a, const Card& b) {
        return a.rank < b.rank;
    });

    std::vector<Card> ordered;
    size_t total = naturals.size() + reading.jokers.size();
    ordered.reserve(total);

    size_t next_natural = 0;
    size_t next_joker = 0;
    for (int r = start; ordered.size() < total; r++) {
        if (next_natural < naturals.size() && rank_index(naturals[next_natural].rank) == r) {
            ordered.push_back(naturals[next_natural++]);
        } else {
            ordered.push_back(reading.jokers[next_joker++]);
        }
    }
    return ordered;
}

} // namespace

// ============================================================================
// CLASSIFICATION
// ============================================================================

bool is_pure_sequence(const std::vector<Card>& cards) {
    if (!all_well_formed(cards)) {
        return false;
    }
    Reading reading = natural_reading(cards);
    return reading.jokers.empty() && run_start(reading).has_value();
}

bool is_valid_sequence(const std::vector<Card>& cards) {
    if (!all_well_formed(cards)) {
        return false;
    }
    return run_start(substitute_reading(cards)).has_value()
        || run_start(natural_reading(cards)).has_value();
}

bool is_valid_set(const std::vector<Card>& cards) {
    if (!all_well_formed(cards)) {
        return false;
    }
    return forms_set(substitute_reading(cards)) || forms_set(natural_reading(cards));
}

std::optional<MeldType> get_meld_type(const std::vector<Card>& cards) {
    if (is_pure_sequence(cards)) {
        return MeldType::PURE_SEQUENCE;
    }
    if (is_valid_sequence(cards)) {
        return MeldType::SEQUENCE;
    }
    if (is_valid_set(cards)) {
        return MeldType::SET;
    }
    return std::nullopt;
}

bool validate_meld(const Meld& meld) {
    switch (meld.type) {
        case MeldType::PURE_SEQUENCE:
            return is_pure_sequence(meld.cards);
        case MeldType::SEQUENCE:
            return is_valid_sequence(meld.cards);
        case MeldType::SET:
            return is_valid_set(meld.cards);
        default:
            return false;
    }
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

std::optional<Meld> create_meld(const std::vector<Card>& cards) {
    auto type = get_meld_type(cards);
    if (!type.has_value()) {
        return std::nullopt;
    }

    if (*type == MeldType::SET) {
        return Meld(MeldType::SET, cards);
    }

    Reading reading = natural_reading(cards);
    auto start = run_start(reading);
    if (!start.has_value()) {
        reading = substitute_reading(cards);
        start = run_start(reading);
    }
    return Meld(*type, order_run(reading, *start));
}

Meld make_meld(MeldType type, std::vector<Card> cards) {
    Meld meld(type, std::move(cards));
    if (type == MeldType::PURE_SEQUENCE) {
        meld.is_pure = is_pure_sequence(meld.cards);
    }
    return meld;
}

int count_jokers(const std::vector<Card>& cards) {
    return static_cast<int>(std::count_if(cards.begin(), cards.end(),
                                          [](const Card& c) { return c.is_joker(); }));
}

} // namespace rummy
