/**
 * Rummy Engine - Hand Arranger Implementation
 *
 * Search outline:
 *   1. Enumerate every pure run (and sub-run) among the natural cards.
 *   2. Anchor on each one in turn and greedily pack the rest:
 *      - while fewer than 2 sequences are secured, prefer more, shorter runs
 *        and split runs of 6+ in two; afterwards prefer longer runs
 *      - sets only once 2 sequences are secured
 *      - jokers complete near-runs (and near-sets once sets count)
 *   3. Return the first anchor that declares, else the lowest deadwood.
 */

#include "hand_arranger.hpp"
#include "hand.hpp"
#include <algorithm>
#include <array>

namespace rummy {

namespace {

using CardGroup = std::vector<Card>;

/**
 * Working state of one packing attempt.
 */
struct Workspace {
    std::vector<Meld> melds;
    CardGroup remaining;   // Natural cards not yet melded
    CardGroup jokers;      // Jokers not yet spent
};

bool card_order(const Card& a, const Card& b) {
    if (a.suit != b.suit) return a.suit < b.suit;
    if (a.rank != b.rank) return a.rank < b.rank;
    return a.id < b.id;
}

std::array<CardGroup, SUIT_COUNT> group_by_suit(const CardGroup& cards) {
    std::array<CardGroup, SUIT_COUNT> by_suit;
    for (const auto& card : cards) {
        by_suit[static_cast<int>(card.suit)].push_back(card);
    }
    for (auto& group : by_suit) {
        std::sort(group.begin(), group.end(), card_order);
    }
    return by_suit;
}

std::array<CardGroup, RANK_COUNT + 1> group_by_rank(const CardGroup& cards) {
    std::array<CardGroup, RANK_COUNT + 1> by_rank;
    for (const auto& card : cards) {
        by_rank[rank_index(card.rank)].push_back(card);
    }
    for (auto& group : by_rank) {
        std::sort(group.begin(), group.end(), card_order);
    }
    return by_rank;
}

// One card per suit, in suit order
CardGroup distinct_suits(const CardGroup& cards) {
    CardGroup unique;
    bool seen[SUIT_COUNT] = {false};
    for (const auto& card : cards) {
        int s = static_cast<int>(card.suit);
        if (seen[s]) continue;
        seen[s] = true;
        unique.push_back(card);
    }
    return unique;
}

int count_sequences(const std::vector<Meld>& melds) {
    return static_cast<int>(std::count_if(melds.begin(), melds.end(),
                                          [](const Meld& m) { return m.is_sequence(); }));
}

int count_pure_sequences(const std::vector<Meld>& melds) {
    return static_cast<int>(std::count_if(melds.begin(), melds.end(),
                                          [](const Meld& m) { return m.type == MeldType::PURE_SEQUENCE; }));
}

bool contains_all(const CardGroup& pool, const CardGroup& group) {
    for (const auto& card : group) {
        if (find_card(pool, card.id) == nullptr) {
            return false;
        }
    }
    return true;
}

void add_all_sub_runs(const CardGroup& run, std::vector<CardGroup>& out) {
    out.push_back(run);

    int n = static_cast<int>(run.size());
    for (int start = 0; start + MIN_MELD_SIZE <= n; start++) {
        for (int end = start + MIN_MELD_SIZE; end <= n; end++) {
            if (end - start != n) {
                out.emplace_back(run.begin() + start, run.begin() + end);
            }
        }
    }
}

void find_consecutive_runs(const CardGroup& sorted, std::vector<CardGroup>& out) {
    if (sorted.size() < static_cast<size_t>(MIN_MELD_SIZE)) {
        return;
    }

    CardGroup run{sorted.front()};
    for (size_t i = 1; i < sorted.size(); i++) {
        int prev = rank_index(run.back().rank);
        int curr = rank_index(sorted[i].rank);

        if (curr == prev) {
            continue;  // Second copy from another deck stays in the pool
        }
        if (curr == prev + 1) {
            run.push_back(sorted[i]);
            continue;
        }
        if (run.size() >= static_cast<size_t>(MIN_MELD_SIZE)) {
            add_all_sub_runs(run, out);
        }
        run = {sorted[i]};
    }

    if (run.size() >= static_cast<size_t>(MIN_MELD_SIZE)) {
        add_all_sub_runs(run, out);
    }
}

bool take_meld(Workspace& ws, const CardGroup& group) {
    auto meld = create_meld(group);
    if (!meld.has_value()) {
        return false;
    }
    ws.melds.push_back(std::move(*meld));
    ws.remaining = exclude_cards(ws.remaining, group);
    return true;
}

// ============================================================================
// JOKER PLACEMENT
// ============================================================================

/**
 * One joker per adjacent same-suit pair: gap 1 extends the pair to a run of
 * three, gap 2 fills the missing middle rank.
 */
void complete_sequences(Workspace& ws) {
    auto by_suit = group_by_suit(ws.remaining);

    for (const auto& suit_cards : by_suit) {
        for (size_t i = 0; i + 1 < suit_cards.size() && !ws.jokers.empty(); i++) {
            const Card& low = suit_cards[i];
            const Card& high = suit_cards[i + 1];

            if (find_card(ws.remaining, low.id) == nullptr ||
                find_card(ws.remaining, high.id) == nullptr) {
                continue;
            }

            int gap = rank_index(high.rank) - rank_index(low.rank);
            if (gap != 1 && gap != 2) {
                continue;
            }

            auto meld = create_meld({low, high, ws.jokers.front()});
            if (!meld.has_value() || !meld->is_sequence()) {
                continue;
            }

            ws.melds.push_back(std::move(*meld));
            ws.remaining = exclude_cards(ws.remaining, {low, high});
            ws.jokers.erase(ws.jokers.begin());
        }
    }
}

/**
 * Pairs of one rank in two suits take one joker as the third card.
 */
void complete_sets(Workspace& ws) {
    auto by_rank = group_by_rank(ws.remaining);

    for (const auto& rank_cards : by_rank) {
        if (ws.jokers.empty()) {
            return;
        }

        CardGroup unique = distinct_suits(rank_cards);
        if (unique.size() != 2) {
            continue;
        }

        CardGroup group = unique;
        group.push_back(ws.jokers.front());
        auto meld = create_meld(group);
        if (!meld.has_value()) {
            continue;
        }

        ws.melds.push_back(std::move(*meld));
        ws.remaining = exclude_cards(ws.remaining, unique);
        ws.jokers.erase(ws.jokers.begin());
    }
}

/**
 * Still short of two sequences: two jokers turn the costliest single card
 * into a run.
 */
void complete_with_joker_pairs(Workspace& ws) {
    while (count_sequences(ws.melds) < 2 && ws.jokers.size() >= 2 && !ws.remaining.empty()) {
        auto costliest = std::max_element(ws.remaining.begin(), ws.remaining.end(),
                                          [](const Card& a, const Card& b) { return a.value < b.value; });

        auto meld = create_meld({*costliest, ws.jokers[0], ws.jokers[1]});
        if (!meld.has_value() || !meld->is_sequence()) {
            return;
        }

        CardID used = costliest->id;
        ws.melds.push_back(std::move(*meld));
        ws.remaining = remove_card_from_hand(ws.remaining, used);
        ws.jokers.erase(ws.jokers.begin(), ws.jokers.begin() + 2);
    }
}

void add_natural_sets(Workspace& ws) {
    for (const auto& set : find_sets(ws.remaining)) {
        if (contains_all(ws.remaining, set)) {
            take_meld(ws, set);
        }
    }
}

/**
 * Put jokers nothing else needed into counted melds so they do not block a
 * declaration: a set below four cards first, then an impure sequence, then
 * a pure sequence when another pure sequence remains.
 */
void absorb_spare_jokers(Workspace& ws) {
    while (!ws.jokers.empty()) {
        const Card joker = ws.jokers.front();
        bool placed = false;

        for (auto& meld : ws.melds) {
            if (!meld.is_set() || meld.size() >= MAX_SET_SIZE) continue;
            CardGroup grown = meld.cards;
            grown.push_back(joker);
            if (is_valid_set(grown)) {
                meld = Meld(MeldType::SET, std::move(grown));
                placed = true;
                break;
            }
        }

        for (int pass = 0; pass < 2 && !placed; pass++) {
            MeldType target = pass == 0 ? MeldType::SEQUENCE : MeldType::PURE_SEQUENCE;
            if (target == MeldType::PURE_SEQUENCE && count_pure_sequences(ws.melds) < 2) {
                break;
            }
            for (auto& meld : ws.melds) {
                if (meld.type != target) continue;
                CardGroup grown = meld.cards;
                grown.push_back(joker);
                auto extended = create_meld(grown);
                if (extended.has_value() && extended->is_sequence()) {
                    meld = std::move(*extended);
                    placed = true;
                    break;
                }
            }
        }

        if (!placed) {
            return;
        }
        ws.jokers.erase(ws.jokers.begin());
    }
}

// ============================================================================
// PACKING
// ============================================================================

HandAnalysis summarize(const Workspace& ws) {
    HandAnalysis analysis;
    analysis.melds = ws.melds;
    analysis.deadwood = ws.remaining;
    analysis.deadwood.insert(analysis.deadwood.end(), ws.jokers.begin(), ws.jokers.end());
    analysis.deadwood_points = calculate_deadwood_points(analysis.deadwood);

    int pure = count_pure_sequences(ws.melds);
    analysis.sequence_count = count_sequences(ws.melds);
    analysis.has_pure_sequence = pure > 0;
    analysis.can_declare = pure >= 1 && analysis.sequence_count >= 2 && analysis.deadwood.empty();
    return analysis;
}

HandAnalysis find_best_arrangement(const CardGroup& remaining_naturals,
                                   const CardGroup& jokers,
                                   const std::vector<Meld>& existing_melds) {
    Workspace ws{existing_melds, remaining_naturals, jokers};

    auto sequences = find_all_pure_sequences(ws.remaining);
    bool need_more_sequences = count_sequences(ws.melds) < 2;

    // Short runs first while the count matters, long runs first afterwards
    std::stable_sort(sequences.begin(), sequences.end(),
                     [need_more_sequences](const CardGroup& a, const CardGroup& b) {
                         return need_more_sequences ? a.size() < b.size() : a.size() > b.size();
                     });

    if (need_more_sequences) {
        for (const auto& run : sequences) {
            if (run.size() < 6 || !contains_all(ws.remaining, run)) {
                continue;
            }
            CardGroup first(run.begin(), run.begin() + 3);
            CardGroup second(run.begin() + 3, run.end());
            auto first_meld = create_meld(first);
            auto second_meld = create_meld(second);
            if (first_meld.has_value() && second_meld.has_value()) {
                ws.melds.push_back(std::move(*first_meld));
                ws.melds.push_back(std::move(*second_meld));
                ws.remaining = exclude_cards(ws.remaining, run);
            }
        }
    }

    for (const auto& run : sequences) {
        if (contains_all(ws.remaining, run)) {
            take_meld(ws, run);
        }
    }

    // Sets carry no weight below two sequences
    if (count_sequences(ws.melds) >= 2) {
        add_natural_sets(ws);
    }

    if (count_sequences(ws.melds) < 2) {
        complete_sequences(ws);
        complete_with_joker_pairs(ws);
        if (count_sequences(ws.melds) >= 2) {
            add_natural_sets(ws);
            complete_sets(ws);
            complete_sequences(ws);
        }
    } else {
        complete_sets(ws);
        complete_sequences(ws);
    }

    absorb_spare_jokers(ws);
    return summarize(ws);
}

bool is_better(const HandAnalysis& a, const HandAnalysis& b) {
    if (a.deadwood_points != b.deadwood_points) {
        return a.deadwood_points < b.deadwood_points;
    }
    if (a.has_pure_sequence != b.has_pure_sequence) {
        return a.has_pure_sequence;
    }
    if (a.sequence_count != b.sequence_count) {
        return a.sequence_count > b.sequence_count;
    }
    return a.deadwood.size() < b.deadwood.size();
}

} // namespace

// ============================================================================
// PUBLIC API
// ============================================================================

std::vector<Card> HandAnalysis::all_cards() const {
    std::vector<Card> cards;
    for (const auto& meld : melds) {
        cards.insert(cards.end(), meld.cards.begin(), meld.cards.end());
    }
    cards.insert(cards.end(), deadwood.begin(), deadwood.end());
    return cards;
}

std::vector<std::vector<Card>> find_all_pure_sequences(const std::vector<Card>& cards) {
    CardGroup naturals;
    for (const auto& card : cards) {
        if (card.is_well_formed() && !card.is_joker()) {
            naturals.push_back(card);
        }
    }

    std::vector<CardGroup> sequences;
    for (const auto& suit_cards : group_by_suit(naturals)) {
        find_consecutive_runs(suit_cards, sequences);
    }
    return sequences;
}

std::vector<std::vector<Card>> find_sets(const std::vector<Card>& cards) {
    CardGroup naturals;
    for (const auto& card : cards) {
        if (card.is_well_formed() && !card.is_joker()) {
            naturals.push_back(card);
        }
    }

    std::vector<CardGroup> sets;
    for (const auto& rank_cards : group_by_rank(naturals)) {
        CardGroup unique = distinct_suits(rank_cards);
        if (unique.size() >= static_cast<size_t>(MIN_MELD_SIZE)) {
            if (unique.size() > static_cast<size_t>(MAX_SET_SIZE)) {
                unique.resize(MAX_SET_SIZE);
            }
            sets.push_back(std::move(unique));
        }
    }
    return sets;
}

HandAnalysis auto_arrange_hand(const std::vector<Card>& cards) {
    CardGroup valid = filter_valid_cards(cards);
    if (valid.empty()) {
        return HandAnalysis{};
    }

    // Canonical order so the result does not depend on how the hand was held
    std::sort(valid.begin(), valid.end(), card_order);

    CardGroup jokers;
    CardGroup naturals;
    for (const auto& card : valid) {
        (card.is_joker() ? jokers : naturals).push_back(card);
    }

    HandAnalysis best;
    best.deadwood = valid;
    best.deadwood_points = calculate_deadwood_points(valid);

    auto pure_sequences = find_all_pure_sequences(naturals);
    if (pure_sequences.empty()) {
        return find_best_arrangement(naturals, jokers, {});
    }

    for (const auto& anchor : pure_sequences) {
        auto anchor_meld = create_meld(anchor);
        if (!anchor_meld.has_value()) {
            continue;
        }

        HandAnalysis candidate = find_best_arrangement(exclude_cards(naturals, anchor), jokers,
                                                       {*anchor_meld});
        if (candidate.can_declare) {
            return candidate;
        }
        if (is_better(candidate, best)) {
            best = std::move(candidate);
        }
    }

    return best;
}

} // namespace rummy
