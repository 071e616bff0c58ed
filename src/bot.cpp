/**
 * Rummy Engine - Bot Decision Engine Implementation
 *
 * Turn state machine:
 *   DRAW     first turn may DROP; otherwise DRAW from deck or discard pile
 *   DISCARD  shed the least useful card, or DECLARE if the kept 13 declare
 */

#include "bot.hpp"
#include "hand.hpp"
#include <algorithm>
#include <cstdlib>

namespace rummy {

namespace {

const BotProfile EASY_PROFILE{1800, 0, false, false, std::nullopt};
const BotProfile MEDIUM_PROFILE{1200, 5, true, false, 70};
const BotProfile HARD_PROFILE{800, 1, true, true, 55};

// Extra willingness to drop when a full-count loss would bust the pool
constexpr int POOL_DANGER_DROP_BONUS = 15;

/**
 * Natural cards in the hand that could meld with `card`: same rank in
 * another suit, or same suit within two ranks.
 */
int meld_partners(const Card& card, const std::vector<Card>& hand) {
    if (card.is_joker()) {
        return 0;
    }
    int partners = 0;
    for (const auto& other : hand) {
        if (other.id == card.id || other.is_joker()) continue;
        int gap = std::abs(rank_index(other.rank) - rank_index(card.rank));
        if (other.rank == card.rank && other.suit != card.suit) {
            partners++;
        } else if (other.suit == card.suit && gap > 0 && gap <= 2) {
            partners++;
        }
    }
    return partners;
}

/**
 * How strongly the discard pile suggests opponents do not want this card:
 * every discarded card of the same rank, or of the same suit one rank away.
 */
int discard_safety(const Card& card, const std::vector<Card>& history) {
    int safety = 0;
    for (const auto& seen : history) {
        if (seen.is_joker()) continue;
        int gap = std::abs(rank_index(seen.rank) - rank_index(card.rank));
        if (seen.rank == card.rank || (seen.suit == card.suit && gap == 1)) {
            safety++;
        }
    }
    return safety;
}

bool in_melds(const CardID& id, const std::vector<Meld>& melds) {
    for (const auto& meld : melds) {
        for (const auto& card : meld.cards) {
            if (card.id == id) return true;
        }
    }
    return false;
}

struct Candidate {
    DiscardChoice choice;
    int partners = 0;
    int safety = 0;
};

// Ordering for discard candidates; true if a is the better card to shed
bool better_discard(const Candidate& a, const Candidate& b, bool read_history) {
    const HandAnalysis& ra = a.choice.remaining;
    const HandAnalysis& rb = b.choice.remaining;
    if (ra.can_declare != rb.can_declare) return ra.can_declare;
    if (ra.deadwood_points != rb.deadwood_points) return ra.deadwood_points < rb.deadwood_points;
    if (ra.sequence_count != rb.sequence_count) return ra.sequence_count > rb.sequence_count;
    if (a.partners != b.partners) return a.partners < b.partners;
    if (read_history && a.safety != b.safety) return a.safety > b.safety;
    if (a.choice.card.value != b.choice.card.value) return a.choice.card.value > b.choice.card.value;
    return a.choice.card.id < b.choice.card.id;
}

/**
 * Easy bots shed the costliest unmelded card without looking ahead.
 */
std::optional<DiscardChoice> shed_top_deadwood(const std::vector<Card>& hand,
                                               const std::optional<CardID>& forbidden_id) {
    HandAnalysis analysis = auto_arrange_hand(hand);

    const Card* pick = nullptr;
    for (const auto& card : analysis.deadwood) {
        if (card.is_joker() || (forbidden_id && card.id == *forbidden_id)) continue;
        if (pick == nullptr || card.value > pick->value ||
            (card.value == pick->value && meld_partners(card, hand) < meld_partners(*pick, hand))) {
            pick = &card;
        }
    }

    if (pick == nullptr) {
        return std::nullopt;
    }
    return DiscardChoice{*pick, auto_arrange_hand(remove_card_from_hand(hand, pick->id))};
}

} // namespace

// ============================================================================
// PROFILES
// ============================================================================

const BotProfile& get_bot_profile(BotDifficulty difficulty) {
    switch (difficulty) {
        case BotDifficulty::EASY: return EASY_PROFILE;
        case BotDifficulty::HARD: return HARD_PROFILE;
        case BotDifficulty::MEDIUM:
        default:
            return MEDIUM_PROFILE;
    }
}

std::string get_bot_name(BotDifficulty difficulty, int index) {
    static const std::vector<std::string> easy_names = {"Rookie Ravi", "Newbie Nisha", "Casual Karan"};
    static const std::vector<std::string> medium_names = {"Steady Sanjay", "Clever Kavya", "Sharp Suresh"};
    static const std::vector<std::string> hard_names = {"Master Meera", "Shark Arjun", "Grandmaster Gita"};

    const std::vector<std::string>* names = &medium_names;
    if (difficulty == BotDifficulty::EASY) names = &easy_names;
    if (difficulty == BotDifficulty::HARD) names = &hard_names;

    int n = static_cast<int>(names->size());
    int slot = ((index % n) + n) % n;
    std::string name = (*names)[slot];
    if (index >= n) {
        name += " " + std::to_string(index / n + 1);
    }
    return name;
}

// ============================================================================
// DECISIONS
// ============================================================================

std::optional<DiscardChoice> choose_discard(BotDifficulty difficulty,
                                            const std::vector<Card>& hand,
                                            const std::vector<Card>& discard_history,
                                            const std::optional<CardID>& forbidden_id) {
    std::vector<Card> cards = filter_valid_cards(hand);
    if (cards.empty()) {
        return std::nullopt;
    }

    const BotProfile& profile = get_bot_profile(difficulty);
    if (!profile.simulate_discards) {
        auto quick = shed_top_deadwood(cards, forbidden_id);
        if (quick.has_value()) {
            return quick;
        }
    }

    // Jokers are only shed when nothing else is allowed
    bool has_natural_option = std::any_of(cards.begin(), cards.end(), [&](const Card& c) {
        return !c.is_joker() && !(forbidden_id && c.id == *forbidden_id);
    });

    std::optional<Candidate> best;
    for (const auto& card : cards) {
        if (forbidden_id && card.id == *forbidden_id && cards.size() > 1) continue;
        if (card.is_joker() && has_natural_option) continue;

        Candidate candidate{DiscardChoice{card, auto_arrange_hand(remove_card_from_hand(cards, card.id))},
                            meld_partners(card, cards),
                            discard_safety(card, discard_history)};

        if (!best.has_value() || better_discard(candidate, *best, profile.read_discard_history)) {
            best = std::move(candidate);
        }
    }

    if (!best.has_value()) {
        return std::nullopt;
    }
    return best->choice;
}

DrawSource choose_draw_source(BotDifficulty difficulty, const BotContext& context) {
    if (!context.top_discard.has_value() || !context.top_discard->is_well_formed()) {
        return DrawSource::DECK;
    }

    const Card& top = *context.top_discard;
    if (top.is_joker()) {
        return DrawSource::DISCARD;
    }

    const BotProfile& profile = get_bot_profile(difficulty);
    HandAnalysis current = auto_arrange_hand(context.hand);

    std::vector<Card> with_top = add_card_to_hand(context.hand, top);
    auto after = choose_discard(difficulty, with_top, context.discard_history, top.id);
    if (!after.has_value()) {
        return DrawSource::DECK;
    }

    const HandAnalysis& kept = after->remaining;
    bool joins_meld = in_melds(top.id, kept.melds);

    // Baseline: the top card sits as deadwood and the costliest deadwood
    // card goes back out, which a deck draw achieves just as well
    int costliest = 0;
    for (const auto& card : current.deadwood) {
        if (!card.is_joker()) costliest = std::max(costliest, card.value);
    }
    int baseline = current.deadwood_points + top.value - costliest;
    int saved = baseline - kept.deadwood_points;

    if (kept.can_declare) {
        return DrawSource::DISCARD;
    }
    if (joins_meld && kept.deadwood_points <= current.deadwood_points) {
        return DrawSource::DISCARD;
    }
    if (profile.simulate_discards && saved >= profile.pickup_margin && profile.pickup_margin > 0) {
        return DrawSource::DISCARD;
    }
    return DrawSource::DECK;
}

bool should_drop(BotDifficulty difficulty, const BotContext& context) {
    const BotProfile& profile = get_bot_profile(difficulty);
    if (!profile.drop_threshold.has_value() || !context.is_first_turn) {
        return false;
    }

    int threshold = *profile.drop_threshold;
    if (context.pool_limit.has_value()) {
        // Dropping would bust the pool by itself
        if (context.current_score + context.first_drop_penalty >= *context.pool_limit) {
            return false;
        }
        if (context.current_score + MAX_ROUND_POINTS >= *context.pool_limit) {
            threshold -= POOL_DANGER_DROP_BONUS;
        }
    }

    HandAnalysis analysis = auto_arrange_hand(context.hand);
    bool far_from_shape = !analysis.has_pure_sequence
        && analysis.sequence_count == 0
        && count_jokers(context.hand) == 0;

    return far_from_shape && analysis.deadwood_points >= threshold;
}

BotDecision get_bot_decision(BotDifficulty difficulty, const BotContext& context) {
    const BotProfile& profile = get_bot_profile(difficulty);
    int think = profile.thinking_time_ms;

    if (context.turn_phase == TurnPhase::DRAW) {
        if (should_drop(difficulty, context)) {
            return BotDecision::drop(think);
        }
        return BotDecision::draw(choose_draw_source(difficulty, context), think);
    }

    auto choice = choose_discard(difficulty, context.hand, context.discard_history, context.picked_up_id);
    if (!choice.has_value()) {
        // Nothing sensible to shed; a drop is the only legal way out
        return BotDecision::drop(think);
    }

    if (choice->remaining.can_declare) {
        return BotDecision::declare(choice->remaining.melds, choice->card, think);
    }
    return BotDecision::discard(choice->card, think);
}

} // namespace rummy
