/**
 * Rummy Engine - Scoring Engine
 *
 * Turns a round outcome into per-player points, accumulates them, and
 * decides eliminations and game end for the pool / deals / points variants.
 * Lower is better: points are penalties.
 */

#pragma once

#include "card.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rummy {

/**
 * PlayerInfo - A seat at the table.
 */
struct PlayerInfo {
    PlayerID id;
    std::string name;
    bool is_bot = false;
    std::optional<BotDifficulty> difficulty;
};

/**
 * RoundResult - How one player's round ended and what everyone scored.
 *
 * player_id is the player whose action ended it (declarer or dropper).
 */
struct RoundResult {
    int round_number = 0;
    PlayerID player_id;
    std::string player_name;
    RoundOutcome outcome = RoundOutcome::VALID_DECLARATION;
    ScoreMap scores;
};

/**
 * Highest points a losing hand can be charged in one round.
 */
int round_point_cap(Variant variant);

/**
 * Points a losing hand is charged: its auto-arranged deadwood, capped.
 */
int losing_hand_points(const std::vector<Card>& hand, Variant variant);

/**
 * Per-player points for a round.
 *
 * VALID_DECLARATION    declarer 0, everyone else their losing_hand_points
 * INVALID_DECLARATION  declarer invalid_penalty, everyone else 0
 * FIRST_DROP           dropper first_drop_penalty, everyone else 0
 * MIDDLE_DROP          dropper middle_drop_penalty, everyone else 0
 *
 * @param hands Hands of the players still in the round, by player id
 * @param player_id Declarer or dropper
 */
ScoreMap calculate_round_scores(const std::unordered_map<PlayerID, std::vector<Card>>& hands,
                                const PlayerID& player_id,
                                RoundOutcome outcome,
                                Variant variant,
                                int first_drop_penalty,
                                int middle_drop_penalty,
                                int invalid_penalty);

/**
 * Add round points to running totals. Negative deltas are ignored so a
 * total never goes down.
 */
ScoreMap update_cumulative_scores(const ScoreMap& scores, const ScoreMap& round_scores);

/**
 * Pool variants only: out once the total reaches the pool limit.
 *
 * @param limit_override Custom pool limit; defaults to the variant's
 */
bool is_player_eliminated(int score, Variant variant,
                          std::optional<int> limit_override = std::nullopt);

/**
 * Pool ends with at most one player left, deals after number_of_deals
 * rounds, points never (the caller decides).
 */
bool should_game_end(const std::vector<PlayerInfo>& players,
                     const ScoreMap& scores,
                     int rounds_played,
                     Variant variant,
                     int number_of_deals,
                     std::optional<int> limit_override = std::nullopt);

/**
 * Lowest total among players still standing; ties go to the earlier seat.
 */
std::optional<PlayerID> determine_game_winner(const std::vector<PlayerInfo>& players,
                                              const ScoreMap& scores,
                                              Variant variant,
                                              std::optional<int> limit_override = std::nullopt);

} // namespace rummy
