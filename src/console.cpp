/**
 * Rummy Engine - Interactive Practice Console
 *
 * Simple REPL for playing practice games against bots and for checking
 * rule mechanics by hand. Also runs bots-only games for soak testing.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <memory>

#include <nlohmann/json.hpp>
#include "rummy_engine.hpp"
#include "serialization.hpp"
#include "xray_logger.hpp"

using namespace rummy;

// Upper bound on actions in one bots-only game before it is abandoned
constexpr int AUTO_ACTION_LIMIT = 20000;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string join_labels(const std::vector<Card>& cards) {
    std::string out;
    for (size_t i = 0; i < cards.size(); i++) {
        if (i > 0) out += " ";
        out += card_label(cards[i]);
    }
    return out;
}

void show_analysis(const HandAnalysis& analysis) {
    for (const auto& meld : analysis.melds) {
        std::cout << "  [" << to_string(meld.type) << "] " << join_labels(meld.cards) << std::endl;
    }
    std::cout << "  deadwood: " << (analysis.deadwood.empty() ? "-" : join_labels(analysis.deadwood))
              << " (" << analysis.deadwood_points << " pts)" << std::endl;
    std::cout << "  pure sequence: " << (analysis.has_pure_sequence ? "yes" : "no")
              << " | sequences: " << analysis.sequence_count
              << " | can declare: " << (analysis.can_declare ? "YES" : "no") << std::endl;
}

void print_help() {
    std::cout << R"(
=== Rummy Practice Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Game Setup:
  new [bots] [difficulty] - New game (default: 2 medium bots, current rules)
  start                   - Deal the next round
  show                    - Show table and your hand

Your Turn:
  hand                    - Show your hand (sorted, with card ids)
  arrange                 - Best arrangement of your hand
  hint                    - What your hand still lacks
  draw deck|discard       - Draw a card
  discard <card_id>       - Discard a card (ends your turn)
  declare <card_id>       - Lay off <card_id> and show the other 13 cards
  drop                    - Leave the round

Bots:
  bot                     - Play one bot action
  bots                    - Play bot actions until it is your turn

Scores:
  scores                  - Cumulative scores and round results

Examples:
  new 3 hard              # Three hard bots
  draw discard            # Take the top discard
  discard d0-7H           # Throw the seven of hearts from deck 0
)" << std::endl;
}

// ============================================================================
// CONSOLE
// ============================================================================

class Console {
public:
    GameSession session;
    GameConfig config;
    int bot_count = 2;
    BotDifficulty difficulty = BotDifficulty::MEDIUM;

    // X-Ray logger for debugging (off unless --xray)
    std::unique_ptr<XRayLogger> xray_logger;

    explicit Console(const GameConfig& config_) : config(config_) {}

    void enable_xray(const std::string& dir) {
        xray_logger = std::make_unique<XRayLogger>(dir);
        session.set_xray_logger(xray_logger.get());
    }

    const PlayerID human_id = "human";

    bool human_to_act() const {
        const PlayerInfo* player = session.current_player();
        return player != nullptr && !player->is_bot;
    }

    void show_table() {
        if (!session.has_round()) {
            std::cout << "No round dealt. Type 'start'." << std::endl;
            return;
        }
        const RoundState& round = *session.round();

        std::cout << "\n========== ROUND " << round.round_number << " ==========" << std::endl;
        std::cout << "Rules: " << to_string(config.variant) << std::endl;
        if (round.wild_joker_card.has_value()) {
            std::cout << "Wild joker: " << card_label(*round.wild_joker_card)
                      << " (all " << to_string(round.wild_rank) << "s are wild)" << std::endl;
        }
        auto top = session.top_discard();
        std::cout << "Discard top: " << (top.has_value() ? card_label(*top) : std::string("(empty)"))
                  << " | Draw pile: " << round.draw_pile.count() << " cards" << std::endl;

        for (const auto& player_id : round.seats) {
            const PlayerInfo* player = session.find_player(player_id);
            std::cout << "  " << (player_id == round.current_player_id() && !round.is_over ? "> " : "  ")
                      << (player ? player->name : player_id)
                      << " [" << session.scores().at(player_id) << " pts]";
            if (!round.is_in_play(player_id)) {
                std::cout << " (dropped)";
            } else if (player_id != human_id) {
                std::cout << " " << session.player_hand(player_id).size() << " cards";
            }
            std::cout << std::endl;
        }

        if (round.is_over) {
            std::cout << "Round over." << std::endl;
        } else {
            const PlayerInfo* current = session.current_player();
            std::cout << "Turn: " << (current ? current->name : "?")
                      << " (" << to_string(round.turn_phase) << ")" << std::endl;
        }
        if (round.is_in_play(human_id)) {
            cmd_hand();
        }
    }

    void cmd_new(const std::vector<std::string>& args) {
        if (args.size() > 1) {
            try {
                bot_count = std::stoi(args[1]);
            } catch (const std::exception&) {
                std::cout << "Bot count must be a number." << std::endl;
                return;
            }
        }
        if (args.size() > 2) {
            auto parsed = parse_difficulty(args[2]);
            if (!parsed.has_value()) {
                std::cout << "Unknown difficulty: " << args[2] << " (easy, medium, hard)" << std::endl;
                return;
            }
            difficulty = *parsed;
        }

        if (!session.create_game("You", bot_count, difficulty, config)) {
            std::cout << "Cannot create game with " << bot_count << " bots (1-" << MAX_BOTS << ")." << std::endl;
            return;
        }

        std::cout << "New " << to_string(config.variant) << " game vs " << bot_count << " "
                  << to_string(difficulty) << " bot(s):";
        for (const auto& player : session.players()) {
            if (player.is_bot) std::cout << " " << player.name << ";";
        }
        std::cout << std::endl;
        cmd_start();
    }

    void cmd_start() {
        if (session.players().empty()) {
            std::cout << "No game. Type 'new'." << std::endl;
            return;
        }
        if (session.phase() == GamePhase::ENDED) {
            std::cout << "Game is over. Type 'new' for another." << std::endl;
            return;
        }
        if (!session.start_round()) {
            std::cout << "Cannot deal now (round still in progress?)." << std::endl;
            return;
        }
        show_table();
        run_bots();
    }

    void cmd_hand() {
        std::vector<Card> hand = sort_hand(session.player_hand(human_id));
        std::cout << "Your hand (" << hand.size() << "):" << std::endl;
        for (const auto& card : hand) {
            std::cout << "  " << card_label(card) << "\t" << card.id
                      << (card.is_joker() ? "\tjoker" : "") << std::endl;
        }
    }

    void cmd_arrange() {
        show_analysis(auto_arrange_hand(session.player_hand(human_id)));
    }

    void cmd_hint() {
        auto hints = get_declaration_hint(session.player_hand(human_id));
        if (hints.empty()) {
            std::cout << "No hand to check." << std::endl;
        }
        for (const auto& hint : hints) {
            std::cout << "  - " << hint << std::endl;
        }
    }

    void cmd_draw(const std::vector<std::string>& args) {
        if (!human_to_act()) {
            std::cout << "Not your turn." << std::endl;
            return;
        }
        DrawSource source = DrawSource::DECK;
        if (args.size() > 1) {
            auto parsed = parse_draw_source(args[1]);
            if (!parsed.has_value()) {
                std::cout << "Usage: draw deck|discard" << std::endl;
                return;
            }
            source = *parsed;
        }

        auto card = session.draw_card(source);
        if (!card.has_value()) {
            std::cout << "Cannot draw from " << to_string(source) << " now." << std::endl;
            return;
        }
        std::cout << "You drew " << card_label(*card) << " (" << card->id << ")" << std::endl;
    }

    void cmd_discard(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: discard <card_id>" << std::endl;
            return;
        }
        if (!human_to_act() || !session.discard_card(args[1])) {
            std::cout << "Cannot discard " << args[1] << " now." << std::endl;
            return;
        }
        std::cout << "You discarded " << args[1] << std::endl;
        run_bots();
    }

    void cmd_declare(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: declare <card_id>" << std::endl;
            return;
        }
        if (!human_to_act() || !session.can_discard()) {
            std::cout << "You can only declare after drawing." << std::endl;
            return;
        }

        std::vector<Card> kept = remove_card_from_hand(session.player_hand(human_id), args[1]);
        HandAnalysis analysis = auto_arrange_hand(kept);
        auto result = session.declare(analysis.melds, args[1]);
        if (!result.has_value()) {
            std::cout << "Cannot declare with " << args[1] << "." << std::endl;
            return;
        }

        const auto& verdict = session.last_declaration();
        if (result->outcome == RoundOutcome::VALID_DECLARATION) {
            std::cout << "\n*** VALID DECLARATION! You win the round. ***" << std::endl;
        } else {
            std::cout << "\n*** INVALID DECLARATION ***" << std::endl;
            if (verdict.has_value()) {
                for (const auto& error : verdict->errors) {
                    std::cout << "  - " << error << std::endl;
                }
            }
        }
        report_round(*result);
    }

    void cmd_drop() {
        if (!human_to_act()) {
            std::cout << "Not your turn." << std::endl;
            return;
        }
        auto result = session.drop();
        if (!result.has_value()) {
            std::cout << "Cannot drop now." << std::endl;
            return;
        }
        std::cout << "You dropped (" << to_string(result->outcome) << ", "
                  << result->scores.at(human_id) << " pts)." << std::endl;
        report_round(*result);
        run_bots();
    }

    void cmd_scores() {
        std::cout << "\n=== SCORES (" << to_string(config.variant) << ") ===" << std::endl;
        for (const auto& player : session.players()) {
            std::cout << "  " << player.name << ": " << session.scores().at(player.id)
                      << (session.is_eliminated(player.id) ? " (eliminated)" : "") << std::endl;
        }
        std::cout << "Rounds played: " << session.rounds_played() << std::endl;
        for (const auto& result : session.round_results()) {
            nlohmann::json j = result;
            std::cout << "  " << j.dump() << std::endl;
        }
    }

    /**
     * Play bot actions until the human is to act or the round ends.
     */
    void run_bots(int limit = -1) {
        int actions = 0;
        while (session.is_bot_turn() && (limit < 0 || actions < limit)) {
            const PlayerInfo* bot = session.current_player();
            std::string name = bot ? bot->name : "?";

            auto decision = session.execute_bot_turn();
            if (!decision.has_value()) {
                std::cout << name << " is stuck; stopping bots." << std::endl;
                return;
            }
            describe_bot_action(name, *decision);
            actions++;

            if (decision->action == BotActionType::DECLARE || decision->action == BotActionType::DROP) {
                if (!session.round_results().empty()) {
                    report_round(session.round_results().back());
                }
            }
        }
        if (session.is_round_in_progress() && human_to_act()) {
            std::cout << "\nYour turn (" << to_string(session.round()->turn_phase) << ")." << std::endl;
        }
    }

    void describe_bot_action(const std::string& name, const BotDecision& decision) {
        std::cout << "  " << name << ": " << to_string(decision.action);
        if (decision.source.has_value()) {
            std::cout << " from " << to_string(*decision.source);
        }
        if (decision.card.has_value()) {
            std::cout << " " << card_label(*decision.card);
        }
        std::cout << std::endl;
    }

    void report_round(const RoundResult& result) {
        std::cout << "Round " << result.round_number << " - " << result.player_name << ": "
                  << to_string(result.outcome) << std::endl;
        for (const auto& player : session.players()) {
            auto it = result.scores.find(player.id);
            if (it != result.scores.end()) {
                std::cout << "  " << player.name << " +" << it->second << std::endl;
            }
        }
        if (session.phase() == GamePhase::ENDED) {
            const PlayerInfo* winner = session.winner() ? session.find_player(*session.winner()) : nullptr;
            std::cout << "\n========== GAME OVER ==========" << std::endl;
            std::cout << "Winner: " << (winner ? winner->name : "nobody") << std::endl;
        } else if (!session.is_round_in_progress()) {
            std::cout << "Type 'start' for the next round." << std::endl;
        }
    }

    void run() {
        std::cout << "Rummy Engine " << get_version() << " - Practice Console" << std::endl;
        std::cout << "=====================================\n" << std::endl;
        std::cout << "Type 'help' for commands, 'new' to begin." << std::endl;

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "new") {
                cmd_new(args);
            } else if (cmd == "start") {
                cmd_start();
            } else if (cmd == "show" || cmd == "s") {
                show_table();
            } else if (cmd == "hand") {
                cmd_hand();
            } else if (cmd == "arrange" || cmd == "a") {
                cmd_arrange();
            } else if (cmd == "hint") {
                cmd_hint();
            } else if (cmd == "draw" || cmd == "d") {
                cmd_draw(args);
            } else if (cmd == "discard" || cmd == "x") {
                cmd_discard(args);
            } else if (cmd == "declare") {
                cmd_declare(args);
            } else if (cmd == "drop") {
                cmd_drop();
            } else if (cmd == "bot") {
                run_bots(1);
            } else if (cmd == "bots") {
                run_bots();
            } else if (cmd == "scores") {
                cmd_scores();
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// BOTS-ONLY SIMULATION
// ============================================================================

/**
 * Play `games` games between bots only (the "human" seat is a bot too) and
 * print per-game results. A points game ends after one round.
 */
int run_auto(int games, const GameConfig& config, BotDifficulty difficulty, int bot_count, XRayLogger* xray) {
    int stalled = 0;

    for (int g = 0; g < games; g++) {
        GameSession session;
        session.set_xray_logger(xray);
        if (!session.create_game("Auto", bot_count, difficulty, config)) {
            std::cerr << "[Auto] Cannot create game" << std::endl;
            return 1;
        }

        int actions = 0;
        while (session.phase() != GamePhase::ENDED && actions < AUTO_ACTION_LIMIT) {
            if (!session.is_round_in_progress()) {
                if (config.variant == Variant::POINTS && session.rounds_played() > 0) break;
                if (!session.start_round()) break;
            }

            std::optional<BotDecision> decision;
            if (session.is_bot_turn()) {
                decision = session.execute_bot_turn();
            } else {
                // Drive the human seat with a medium bot
                auto context = session.bot_context();
                if (!context.has_value()) break;
                BotDecision d = get_bot_decision(BotDifficulty::MEDIUM, *context);
                bool applied = false;
                switch (d.action) {
                    case BotActionType::DRAW:
                        applied = session.draw_card(d.source.value_or(DrawSource::DECK)).has_value()
                               || session.draw_card(DrawSource::DECK).has_value();
                        break;
                    case BotActionType::DISCARD:
                        applied = d.card.has_value() && session.discard_card(d.card->id);
                        break;
                    case BotActionType::DECLARE:
                        applied = d.card.has_value() && session.declare(d.melds, d.card->id).has_value();
                        break;
                    case BotActionType::DROP:
                        applied = session.drop().has_value();
                        break;
                }
                if (applied) decision = d;
            }

            if (!decision.has_value()) break;
            actions++;
        }

        if (actions >= AUTO_ACTION_LIMIT) {
            stalled++;
        }

        std::cout << "[Auto] Game " << (g + 1) << ": " << session.rounds_played() << " round(s), winner "
                  << (session.winner() ? *session.winner() : std::string("-")) << ", scores";
        for (const auto& player : session.players()) {
            std::cout << " " << player.id << "=" << session.scores().at(player.id);
        }
        std::cout << std::endl;
    }

    if (stalled > 0) {
        std::cerr << "[Auto] " << stalled << " game(s) hit the action limit" << std::endl;
    }
    return 0;
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    GameConfig config = GameConfig::defaults_for(Variant::POINTS);
    bool xray = false;
    std::string xray_dir = "xrays";
    int auto_games = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            if (!load_game_config(argv[++i], config)) {
                return 1;
            }
        } else if (arg == "--xray") {
            xray = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                xray_dir = argv[++i];
            }
        } else if (arg == "--auto" && i + 1 < argc) {
            try {
                auto_games = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--auto expects a game count" << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Usage: rummy_console [--config <file>] [--xray [dir]] [--auto <games>]" << std::endl;
            return 1;
        }
    }

    if (auto_games > 0) {
        std::unique_ptr<XRayLogger> logger;
        if (xray) {
            logger = std::make_unique<XRayLogger>(xray_dir);
        }
        return run_auto(auto_games, config, BotDifficulty::MEDIUM, 3, logger.get());
    }

    Console console(config);
    if (xray) {
        console.enable_xray(xray_dir);
    }
    console.run();
    return 0;
}
