/**
 * Rummy Engine - Scoring Engine Implementation
 */

#include "scoring.hpp"
#include "hand_arranger.hpp"
#include <algorithm>

namespace rummy {

namespace {

int score_of(const ScoreMap& scores, const PlayerID& id) {
    auto it = scores.find(id);
    return it != scores.end() ? it->second : 0;
}

int acting_player_points(RoundOutcome outcome, int first_drop_penalty,
                         int middle_drop_penalty, int invalid_penalty) {
    switch (outcome) {
        case RoundOutcome::INVALID_DECLARATION: return invalid_penalty;
        case RoundOutcome::FIRST_DROP: return first_drop_penalty;
        case RoundOutcome::MIDDLE_DROP: return middle_drop_penalty;
        case RoundOutcome::VALID_DECLARATION:
        default:
            return 0;
    }
}

} // namespace

int round_point_cap(Variant /*variant*/) {
    // Same full-count cap in every variant currently offered
    return MAX_ROUND_POINTS;
}

int losing_hand_points(const std::vector<Card>& hand, Variant variant) {
    HandAnalysis analysis = auto_arrange_hand(hand);
    return std::min(analysis.deadwood_points, round_point_cap(variant));
}

ScoreMap calculate_round_scores(const std::unordered_map<PlayerID, std::vector<Card>>& hands,
                                const PlayerID& player_id,
                                RoundOutcome outcome,
                                Variant variant,
                                int first_drop_penalty,
                                int middle_drop_penalty,
                                int invalid_penalty) {
    ScoreMap scores;

    for (const auto& entry : hands) {
        const PlayerID& id = entry.first;
        if (id == player_id) {
            scores[id] = acting_player_points(outcome, first_drop_penalty,
                                              middle_drop_penalty, invalid_penalty);
        } else if (outcome == RoundOutcome::VALID_DECLARATION) {
            scores[id] = losing_hand_points(entry.second, variant);
        } else {
            scores[id] = 0;
        }
    }

    // The acting player is charged even if their hand was not passed in
    if (scores.find(player_id) == scores.end()) {
        scores[player_id] = acting_player_points(outcome, first_drop_penalty,
                                                 middle_drop_penalty, invalid_penalty);
    }

    return scores;
}

ScoreMap update_cumulative_scores(const ScoreMap& scores, const ScoreMap& round_scores) {
    ScoreMap updated = scores;
    for (const auto& entry : round_scores) {
        updated[entry.first] += std::max(0, entry.second);
    }
    return updated;
}

bool is_player_eliminated(int score, Variant variant, std::optional<int> limit_override) {
    if (!is_pool_variant(variant)) {
        return false;
    }
    int limit = limit_override.value_or(pool_limit(variant).value_or(0));
    return limit > 0 && score >= limit;
}

bool should_game_end(const std::vector<PlayerInfo>& players,
                     const ScoreMap& scores,
                     int rounds_played,
                     Variant variant,
                     int number_of_deals,
                     std::optional<int> limit_override) {
    switch (variant) {
        case Variant::POOL_101:
        case Variant::POOL_201: {
            int standing = 0;
            for (const auto& player : players) {
                if (!is_player_eliminated(score_of(scores, player.id), variant, limit_override)) {
                    standing++;
                }
            }
            return standing <= 1;
        }
        case Variant::DEALS:
            return rounds_played >= number_of_deals;
        case Variant::POINTS:
        default:
            return false;
    }
}

std::optional<PlayerID> determine_game_winner(const std::vector<PlayerInfo>& players,
                                              const ScoreMap& scores,
                                              Variant variant,
                                              std::optional<int> limit_override) {
    std::optional<PlayerID> winner;
    int best = 0;

    for (const auto& player : players) {
        int score = score_of(scores, player.id);
        if (is_player_eliminated(score, variant, limit_override)) {
            continue;
        }
        if (!winner.has_value() || score < best) {
            winner = player.id;
            best = score;
        }
    }

    return winner;
}

} // namespace rummy
