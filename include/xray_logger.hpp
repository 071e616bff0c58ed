/**
 * Rummy Engine - X-Ray Logger
 *
 * Complete table visibility for debugging.
 * Logs every hand, both piles and the wild joker, with card ids so exact
 * card movement can be tracked across a game.
 */

#pragma once

#include "scoring.hpp"
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace rummy {

// Forward declaration
class GameSession;

/**
 * XRayLogger - Full-visibility game trace.
 *
 * Logs hidden information (bot hands, draw pile order) that no player can
 * see, for auditing card movement and rule enforcement.
 */
class XRayLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param output_dir Directory for log files (created if missing)
     */
    explicit XRayLogger(const std::string& output_dir = "xrays");

    ~XRayLogger();

    /**
     * Log an action header.
     *
     * @param turn_count Turn number within the round
     * @param player_id Player taking action
     * @param description Action text, e.g. "DISCARD 7H"
     */
    void log_action(int turn_count, const PlayerID& player_id, const std::string& description);

    /**
     * Log complete table snapshot (including hidden hands and piles).
     */
    void log_state(const GameSession& session);

    void log_round_start(int round_number, const PlayerID& dealer_id);

    /**
     * Log the points of one round result and the running totals.
     */
    void log_round_result(const RoundResult& result, const ScoreMap& totals);

    void log_round_end(int round_number, const std::optional<PlayerID>& winner, const std::string& reason);

    /**
     * Log game end result.
     *
     * @param winner Winning player ID (nullopt if nobody is left)
     * @param reason Reason for game end
     */
    void log_game_end(const std::optional<PlayerID>& winner, const std::string& reason);

    /**
     * Get the log file path.
     */
    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format card as "10H (d1-10H)"; wild jokers carry a '*'.
     */
    std::string fmt_card(const Card& card) const;

    /**
     * Format a labelled card list: "DRAW PILE (40): [..., ...]"
     */
    std::string fmt_cards(const std::string& label, const std::vector<Card>& cards) const;

    static std::string timestamp_now(const char* format);
};

} // namespace rummy
