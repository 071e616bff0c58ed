/**
 * Rummy Engine - Game Session
 *
 * Round and game lifecycle for one table: seats, dealing, turn order,
 * draw / discard / declare / drop, bot turns, and score bookkeeping through
 * the Scoring Engine. Mutators return false / nullopt when an action is not
 * legal in the current state and leave the state unchanged.
 */

#pragma once

#include "bot.hpp"
#include "declaration.hpp"
#include "deck.hpp"
#include "game_config.hpp"
#include "scoring.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rummy {

class XRayLogger;

constexpr int MIN_BOTS = 1;
constexpr int MAX_BOTS = 5;

/**
 * RoundState - One deal, from the shuffle to its end.
 *
 * A player is in play while their hand is in `hands`; dropping removes it.
 */
struct RoundState {
    int round_number = 0;
    std::vector<PlayerID> seats;            // Dealt-in players, seat order
    int dealer_index = 0;
    int current_index = 0;
    TurnPhase turn_phase = TurnPhase::DRAW;
    int turn_count = 1;

    std::unordered_map<PlayerID, std::vector<Card>> hands;
    Pile draw_pile;
    Pile discard_pile;
    std::vector<Card> discard_history;      // Every card that reached the discard pile
    std::optional<Card> wild_joker_card;
    Rank wild_rank = Rank::ACE;

    std::unordered_set<PlayerID> has_drawn;
    std::optional<CardID> picked_up_id;     // Taken from the discard pile this turn

    bool is_over = false;
    std::optional<PlayerID> winner_id;

    bool is_in_play(const PlayerID& player_id) const {
        return hands.count(player_id) > 0;
    }

    int players_in_play() const {
        return static_cast<int>(hands.size());
    }

    const PlayerID& current_player_id() const {
        return seats[current_index];
    }
};

/**
 * GameSession - Controller for a practice table (one human, 1-5 bots).
 */
class GameSession {
public:
    GameSession();

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /**
     * Seat a new table and reset scores. Player ids are "human" and
     * "bot-0".."bot-N". Returns false for a bot count outside 1-5 or an
     * invalid config.
     */
    bool create_game(const std::string& human_name,
                     int bot_count,
                     BotDifficulty difficulty,
                     const GameConfig& config);

    /**
     * Shuffle and deal the next round. The dealer rotates every round and
     * the player after the dealer moves first. Eliminated players are not
     * dealt in.
     *
     * @param seed Reseeds the shuffle when set, for reproducible deals
     */
    bool start_round(std::optional<uint32_t> seed = std::nullopt);

    // ========================================================================
    // TURN ACTIONS (current player)
    // ========================================================================

    /**
     * Take the top card of the draw pile (refilled from the discard pile
     * when empty) or of the discard pile.
     */
    std::optional<Card> draw_card(DrawSource source);

    /**
     * Discard a card and pass the turn. The card picked up from the discard
     * pile this turn cannot be thrown straight back.
     */
    bool discard_card(const CardID& card_id);

    /**
     * Show: lay off `finish_card_id` and declare the other 13 cards as
     * `melds` (cards not in any meld count as deadwood). Ends the round
     * whether or not the declaration is valid.
     *
     * Returns nullopt if not in the discard phase or a named card is not
     * in the hand.
     */
    std::optional<RoundResult> declare(const std::vector<Meld>& melds, const CardID& finish_card_id);

    /**
     * Leave the round. A first drop if the player has not drawn yet this
     * round, otherwise a middle drop.
     */
    std::optional<RoundResult> drop();

    // ========================================================================
    // BOTS
    // ========================================================================

    bool is_bot_turn() const;

    /**
     * Read-only view for the current player's bot.
     */
    std::optional<BotContext> bot_context() const;

    /**
     * Decide and apply one bot action. Returns the decision so the caller
     * can show its thinking delay; nullopt if it is not a bot's turn or the
     * action could not be applied.
     */
    std::optional<BotDecision> execute_bot_turn();

    // ========================================================================
    // QUERIES
    // ========================================================================

    GamePhase phase() const { return phase_; }
    const GameConfig& config() const { return config_; }
    const std::vector<PlayerInfo>& players() const { return players_; }
    const ScoreMap& scores() const { return scores_; }
    const std::vector<RoundResult>& round_results() const { return round_results_; }
    int rounds_played() const { return rounds_played_; }
    const std::optional<PlayerID>& winner() const { return winner_; }

    // Verdict on the most recent show, valid or not
    const std::optional<DeclarationResult>& last_declaration() const { return last_declaration_; }

    bool has_round() const { return round_.has_value(); }
    bool is_round_in_progress() const { return round_.has_value() && !round_->is_over; }
    const std::optional<RoundState>& round() const { return round_; }

    const PlayerInfo* find_player(const PlayerID& player_id) const;
    const PlayerInfo* current_player() const;
    std::optional<Card> top_discard() const;
    std::vector<Card> player_hand(const PlayerID& player_id) const;

    bool is_eliminated(const PlayerID& player_id) const;
    bool can_draw() const;
    bool can_discard() const;

    /**
     * Attach a trace logger (not owned). nullptr detaches.
     */
    void set_xray_logger(XRayLogger* logger) { xray_ = logger; }

private:
    GameConfig config_;
    std::vector<PlayerInfo> players_;
    ScoreMap scores_;
    std::vector<RoundResult> round_results_;
    int rounds_played_ = 0;
    GamePhase phase_ = GamePhase::SETUP;
    std::optional<PlayerID> winner_;
    std::optional<DeclarationResult> last_declaration_;

    std::optional<RoundState> round_;
    std::mt19937 rng_;
    XRayLogger* xray_ = nullptr;

    std::vector<Card>& current_hand();
    void advance_turn();
    RoundResult record_result(const PlayerID& player_id, RoundOutcome outcome, const ScoreMap& round_scores);
    void end_round(std::optional<PlayerID> round_winner, const std::string& reason);
    void check_game_end();
    void log_action(const PlayerID& player_id, const std::string& description);
};

} // namespace rummy
