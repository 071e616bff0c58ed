/**
 * Rummy Engine - X-Ray Logger Implementation
 */

#include "xray_logger.hpp"
#include "game_session.hpp"
#include "hand.hpp"
#include "hand_arranger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rummy {

XRayLogger::XRayLogger(const std::string& output_dir) {
    // Create output directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[X-Ray Logger] Cannot create " << output_dir << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    log_path_ = output_dir + "/xray_game_" + timestamp_now("%Y%m%d_%H%M%S") + ".log";

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[X-Ray Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    // Write header
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "X-RAY GAME LOG - RUMMY TABLE TRACE\n";
    log_file_ << "Started: " << timestamp_now("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[X-Ray Logger] Logging to: " << log_path_ << std::endl;
}

XRayLogger::~XRayLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string XRayLogger::timestamp_now(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

std::string XRayLogger::fmt_card(const Card& card) const {
    return card_label(card) + " (" + card.id + ")";
}

std::string XRayLogger::fmt_cards(const std::string& label, const std::vector<Card>& cards) const {
    std::ostringstream line;
    line << label << " (" << cards.size() << "): [";
    for (size_t i = 0; i < cards.size(); i++) {
        if (i > 0) line << ", ";
        line << fmt_card(cards[i]);
    }
    line << "]";
    return line.str();
}

void XRayLogger::log_action(int turn_count, const PlayerID& player_id, const std::string& description) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << turn_count << " | PLAYER: " << player_id << "] ACTION: " << description << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_state(const GameSession& session) {
    if (!enabled_ || !log_file_.is_open()) return;
    if (!session.round().has_value()) return;

    const RoundState& round = *session.round();

    log_file_ << std::string(80, '=') << "\n";

    for (const auto& player_id : round.seats) {
        const PlayerInfo* player = session.find_player(player_id);
        log_file_ << "[" << player_id;
        if (player != nullptr) {
            log_file_ << " | " << player->name;
        }
        log_file_ << "]";

        if (!round.is_in_play(player_id)) {
            log_file_ << " DROPPED\n";
            continue;
        }

        std::vector<Card> hand = session.player_hand(player_id);
        log_file_ << " deadwood: " << auto_arrange_hand(hand).deadwood_points << "\n";
        log_file_ << fmt_cards("HAND", sort_hand(hand)) << "\n";
    }

    log_file_ << "\n[TABLE]\n";
    if (round.wild_joker_card.has_value()) {
        log_file_ << "Wild Joker: " << fmt_card(*round.wild_joker_card)
                  << " | Wild Rank: " << to_string(round.wild_rank) << "\n";
    } else {
        log_file_ << "Wild Joker: (None)\n";
    }
    log_file_ << fmt_cards("DRAW PILE", round.draw_pile.cards) << "\n";
    log_file_ << fmt_cards("DISCARD PILE", round.discard_pile.cards) << "\n";

    log_file_ << "Round: " << round.round_number
              << " | Turn: " << round.turn_count
              << " | Phase: " << to_string(round.turn_phase)
              << " | Current: " << round.current_player_id() << "\n";

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_round_start(int round_number, const PlayerID& dealer_id) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '-') << "\n";
    log_file_ << "ROUND " << round_number << " | Dealer: " << dealer_id << "\n";
    log_file_ << std::string(80, '-') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_round_result(const RoundResult& result, const ScoreMap& totals) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "RESULT: " << result.player_id << " " << to_string(result.outcome) << "\n";
    for (const auto& [player_id, points] : result.scores) {
        auto total = totals.find(player_id);
        log_file_ << "  " << player_id << ": +" << points
                  << " (total " << (total != totals.end() ? total->second : points) << ")\n";
    }
    log_file_ << "\n";

    log_file_.flush();
}

void XRayLogger::log_round_end(int round_number, const std::optional<PlayerID>& winner, const std::string& reason) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '-') << "\n";
    log_file_ << "ROUND " << round_number << " END | "
              << (winner.has_value() ? "Winner: " + *winner : std::string("No winner"))
              << " | " << reason << "\n";
    log_file_ << std::string(80, '-') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_game_end(const std::optional<PlayerID>& winner, const std::string& reason) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "GAME END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (winner.has_value()) {
        log_file_ << "Winner: " << *winner << "\n";
    } else {
        log_file_ << "Result: No winner\n";
    }

    log_file_ << "Reason: " << reason << "\n";
    log_file_ << "Ended: " << timestamp_now("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace rummy
