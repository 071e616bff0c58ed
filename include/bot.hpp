/**
 * Rummy Engine - Bot Decision Engine
 *
 * Rule-driven opponents. A decision is a pure function of the difficulty and
 * a read-only view of the round; the caller applies it (after the thinking
 * delay, if it shows one).
 */

#pragma once

#include "hand_arranger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rummy {

/**
 * BotContext - What a bot may look at on its turn.
 */
struct BotContext {
    std::vector<Card> hand;                 // 13 in DRAW phase, 14 in DISCARD phase
    std::optional<Card> top_discard;
    std::vector<Card> discard_history;      // Everything discarded this round, oldest first
    TurnPhase turn_phase = TurnPhase::DRAW;
    bool is_first_turn = false;
    int current_score = 0;
    std::optional<int> pool_limit;
    int first_drop_penalty = 20;
    std::optional<CardID> picked_up_id;     // Card taken from the discard pile this turn
};

/**
 * BotDecision - One action for the caller to apply.
 *
 * DRAW carries source; DISCARD carries card; DECLARE carries the melds of
 * the 13 kept cards plus the card laid off to finish; DROP carries nothing.
 * thinking_time_ms is presentation only.
 */
struct BotDecision {
    BotActionType action = BotActionType::DRAW;
    std::optional<DrawSource> source;
    std::optional<Card> card;
    std::vector<Meld> melds;
    int thinking_time_ms = 0;

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static BotDecision draw(DrawSource source, int thinking_time_ms) {
        BotDecision d;
        d.action = BotActionType::DRAW;
        d.source = source;
        d.thinking_time_ms = thinking_time_ms;
        return d;
    }

    static BotDecision discard(const Card& card, int thinking_time_ms) {
        BotDecision d;
        d.action = BotActionType::DISCARD;
        d.card = card;
        d.thinking_time_ms = thinking_time_ms;
        return d;
    }

    static BotDecision declare(std::vector<Meld> melds, const Card& finish_card, int thinking_time_ms) {
        BotDecision d;
        d.action = BotActionType::DECLARE;
        d.melds = std::move(melds);
        d.card = finish_card;
        d.thinking_time_ms = thinking_time_ms;
        return d;
    }

    static BotDecision drop(int thinking_time_ms) {
        BotDecision d;
        d.action = BotActionType::DROP;
        d.thinking_time_ms = thinking_time_ms;
        return d;
    }
};

/**
 * BotProfile - Knobs that separate the difficulties.
 */
struct BotProfile {
    int thinking_time_ms = 1000;
    int pickup_margin = 5;                  // Deadwood points a pickup must save
    bool simulate_discards = true;          // Try every discard vs. shed the top deadwood card
    bool read_discard_history = false;      // Prefer discards opponents showed they do not need
    std::optional<int> drop_threshold;      // First-turn deadwood that triggers a drop
};

const BotProfile& get_bot_profile(BotDifficulty difficulty);

/**
 * DiscardChoice - The card to shed and the 13-card hand it leaves.
 */
struct DiscardChoice {
    Card card;
    HandAnalysis remaining;
};

/**
 * Decide the bot's next action.
 */
BotDecision get_bot_decision(BotDifficulty difficulty, const BotContext& context);

/**
 * Deck or discard pile. Takes the discard only if it ends up in a meld or
 * saves at least the profile's margin in deadwood.
 */
DrawSource choose_draw_source(BotDifficulty difficulty, const BotContext& context);

/**
 * Pick the card to shed from a 14-card hand.
 *
 * @param forbidden_id A card that may not be shed (the one just picked up)
 */
std::optional<DiscardChoice> choose_discard(BotDifficulty difficulty,
                                            const std::vector<Card>& hand,
                                            const std::vector<Card>& discard_history,
                                            const std::optional<CardID>& forbidden_id = std::nullopt);

/**
 * First-turn drop check.
 */
bool should_drop(BotDifficulty difficulty, const BotContext& context);

/**
 * Display name for the index-th bot of a difficulty.
 */
std::string get_bot_name(BotDifficulty difficulty, int index);

} // namespace rummy
