/**
 * Rummy Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Exposes the pure rule functions plus GameSession for scripted play.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "rummy_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(rummy_engine_cpp, m) {
    m.doc() = "Indian Rummy rules and decision engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<rummy::Suit>(m, "Suit")
        .value("SPADES", rummy::Suit::SPADES)
        .value("HEARTS", rummy::Suit::HEARTS)
        .value("DIAMONDS", rummy::Suit::DIAMONDS)
        .value("CLUBS", rummy::Suit::CLUBS)
        .export_values();

    py::enum_<rummy::Rank>(m, "Rank")
        .value("ACE", rummy::Rank::ACE)
        .value("TWO", rummy::Rank::TWO)
        .value("THREE", rummy::Rank::THREE)
        .value("FOUR", rummy::Rank::FOUR)
        .value("FIVE", rummy::Rank::FIVE)
        .value("SIX", rummy::Rank::SIX)
        .value("SEVEN", rummy::Rank::SEVEN)
        .value("EIGHT", rummy::Rank::EIGHT)
        .value("NINE", rummy::Rank::NINE)
        .value("TEN", rummy::Rank::TEN)
        .value("JACK", rummy::Rank::JACK)
        .value("QUEEN", rummy::Rank::QUEEN)
        .value("KING", rummy::Rank::KING)
        .export_values();

    py::enum_<rummy::JokerType>(m, "JokerType")
        .value("NONE", rummy::JokerType::NONE)
        .value("PRINTED", rummy::JokerType::PRINTED)
        .value("WILD", rummy::JokerType::WILD)
        .export_values();

    py::enum_<rummy::MeldType>(m, "MeldType")
        .value("PURE_SEQUENCE", rummy::MeldType::PURE_SEQUENCE)
        .value("SEQUENCE", rummy::MeldType::SEQUENCE)
        .value("SET", rummy::MeldType::SET)
        .export_values();

    py::enum_<rummy::Variant>(m, "Variant")
        .value("POINTS", rummy::Variant::POINTS)
        .value("POOL_101", rummy::Variant::POOL_101)
        .value("POOL_201", rummy::Variant::POOL_201)
        .value("DEALS", rummy::Variant::DEALS)
        .export_values();

    py::enum_<rummy::BotDifficulty>(m, "BotDifficulty")
        .value("EASY", rummy::BotDifficulty::EASY)
        .value("MEDIUM", rummy::BotDifficulty::MEDIUM)
        .value("HARD", rummy::BotDifficulty::HARD)
        .export_values();

    py::enum_<rummy::TurnPhase>(m, "TurnPhase")
        .value("DRAW", rummy::TurnPhase::DRAW)
        .value("DISCARD", rummy::TurnPhase::DISCARD);

    py::enum_<rummy::DrawSource>(m, "DrawSource")
        .value("DECK", rummy::DrawSource::DECK)
        .value("DISCARD", rummy::DrawSource::DISCARD);

    py::enum_<rummy::BotActionType>(m, "BotActionType")
        .value("DRAW", rummy::BotActionType::DRAW)
        .value("DISCARD", rummy::BotActionType::DISCARD)
        .value("DECLARE", rummy::BotActionType::DECLARE)
        .value("DROP", rummy::BotActionType::DROP);

    py::enum_<rummy::RoundOutcome>(m, "RoundOutcome")
        .value("VALID_DECLARATION", rummy::RoundOutcome::VALID_DECLARATION)
        .value("INVALID_DECLARATION", rummy::RoundOutcome::INVALID_DECLARATION)
        .value("FIRST_DROP", rummy::RoundOutcome::FIRST_DROP)
        .value("MIDDLE_DROP", rummy::RoundOutcome::MIDDLE_DROP)
        .export_values();

    py::enum_<rummy::GamePhase>(m, "GamePhase")
        .value("SETUP", rummy::GamePhase::SETUP)
        .value("PLAYING", rummy::GamePhase::PLAYING)
        .value("ENDED", rummy::GamePhase::ENDED)
        .export_values();

    // ========================================================================
    // CARD / MELD
    // ========================================================================

    py::class_<rummy::Card>(m, "Card")
        .def(py::init<>())
        .def(py::init<rummy::CardID, rummy::Suit, rummy::Rank, rummy::JokerType>(),
             py::arg("id"), py::arg("suit"), py::arg("rank"),
             py::arg("joker_type") = rummy::JokerType::NONE)
        .def_readonly("id", &rummy::Card::id)
        .def_readonly("suit", &rummy::Card::suit)
        .def_readonly("rank", &rummy::Card::rank)
        .def_readonly("joker_type", &rummy::Card::joker_type)
        .def_readonly("value", &rummy::Card::value)
        .def("is_joker", &rummy::Card::is_joker)
        .def("is_well_formed", &rummy::Card::is_well_formed)
        .def("__str__", &rummy::card_label)
        .def("__repr__", &rummy::card_label)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def_static("printed_joker", &rummy::Card::printed_joker);

    py::class_<rummy::Meld>(m, "Meld")
        .def(py::init<>())
        .def(py::init<rummy::MeldType, std::vector<rummy::Card>>())
        .def_readwrite("type", &rummy::Meld::type)
        .def_readwrite("cards", &rummy::Meld::cards)
        .def_readwrite("is_pure", &rummy::Meld::is_pure)
        .def("is_sequence", &rummy::Meld::is_sequence)
        .def("is_set", &rummy::Meld::is_set);

    // ========================================================================
    // RESULTS
    // ========================================================================

    py::class_<rummy::DeclarationResult>(m, "DeclarationResult")
        .def_readonly("is_valid", &rummy::DeclarationResult::is_valid)
        .def_readonly("has_pure_sequence", &rummy::DeclarationResult::has_pure_sequence)
        .def_readonly("has_minimum_sequences", &rummy::DeclarationResult::has_minimum_sequences)
        .def_readonly("all_cards_melded", &rummy::DeclarationResult::all_cards_melded)
        .def_readonly("melds", &rummy::DeclarationResult::melds)
        .def_readonly("deadwood", &rummy::DeclarationResult::deadwood)
        .def_readonly("deadwood_points", &rummy::DeclarationResult::deadwood_points)
        .def_readonly("errors", &rummy::DeclarationResult::errors);

    py::class_<rummy::HandAnalysis>(m, "HandAnalysis")
        .def_readonly("melds", &rummy::HandAnalysis::melds)
        .def_readonly("deadwood", &rummy::HandAnalysis::deadwood)
        .def_readonly("deadwood_points", &rummy::HandAnalysis::deadwood_points)
        .def_readonly("has_pure_sequence", &rummy::HandAnalysis::has_pure_sequence)
        .def_readonly("sequence_count", &rummy::HandAnalysis::sequence_count)
        .def_readonly("can_declare", &rummy::HandAnalysis::can_declare);

    py::class_<rummy::PlayerInfo>(m, "PlayerInfo")
        .def_readonly("id", &rummy::PlayerInfo::id)
        .def_readonly("name", &rummy::PlayerInfo::name)
        .def_readonly("is_bot", &rummy::PlayerInfo::is_bot)
        .def_readonly("difficulty", &rummy::PlayerInfo::difficulty);

    py::class_<rummy::RoundResult>(m, "RoundResult")
        .def_readonly("round_number", &rummy::RoundResult::round_number)
        .def_readonly("player_id", &rummy::RoundResult::player_id)
        .def_readonly("player_name", &rummy::RoundResult::player_name)
        .def_readonly("outcome", &rummy::RoundResult::outcome)
        .def_readonly("scores", &rummy::RoundResult::scores);

    py::class_<rummy::BotContext>(m, "BotContext")
        .def(py::init<>())
        .def_readwrite("hand", &rummy::BotContext::hand)
        .def_readwrite("top_discard", &rummy::BotContext::top_discard)
        .def_readwrite("discard_history", &rummy::BotContext::discard_history)
        .def_readwrite("turn_phase", &rummy::BotContext::turn_phase)
        .def_readwrite("is_first_turn", &rummy::BotContext::is_first_turn)
        .def_readwrite("current_score", &rummy::BotContext::current_score)
        .def_readwrite("pool_limit", &rummy::BotContext::pool_limit)
        .def_readwrite("first_drop_penalty", &rummy::BotContext::first_drop_penalty)
        .def_readwrite("picked_up_id", &rummy::BotContext::picked_up_id);

    py::class_<rummy::BotDecision>(m, "BotDecision")
        .def_readonly("action", &rummy::BotDecision::action)
        .def_readonly("source", &rummy::BotDecision::source)
        .def_readonly("card", &rummy::BotDecision::card)
        .def_readonly("melds", &rummy::BotDecision::melds)
        .def_readonly("thinking_time_ms", &rummy::BotDecision::thinking_time_ms);

    py::class_<rummy::GameConfig>(m, "GameConfig")
        .def(py::init<>())
        .def_readwrite("variant", &rummy::GameConfig::variant)
        .def_readwrite("pool_limit", &rummy::GameConfig::pool_limit)
        .def_readwrite("number_of_deals", &rummy::GameConfig::number_of_deals)
        .def_readwrite("first_drop_penalty", &rummy::GameConfig::first_drop_penalty)
        .def_readwrite("middle_drop_penalty", &rummy::GameConfig::middle_drop_penalty)
        .def_readwrite("invalid_declaration_penalty", &rummy::GameConfig::invalid_declaration_penalty)
        .def("effective_pool_limit", &rummy::GameConfig::effective_pool_limit)
        .def_static("defaults_for", &rummy::GameConfig::defaults_for);

    // ========================================================================
    // RULE FUNCTIONS
    // ========================================================================

    m.def("validate_meld", &rummy::validate_meld);
    m.def("get_meld_type", &rummy::get_meld_type);
    m.def("validate_declaration", &rummy::validate_declaration,
          py::arg("melds"), py::arg("extra_deadwood") = std::vector<rummy::Card>{});
    m.def("can_declare", &rummy::can_declare);
    m.def("get_declaration_hint", &rummy::get_declaration_hint);
    m.def("auto_arrange_hand", &rummy::auto_arrange_hand);
    m.def("create_decks", &rummy::create_decks);
    m.def("calculate_round_scores", &rummy::calculate_round_scores);
    m.def("update_cumulative_scores", &rummy::update_cumulative_scores);
    m.def("is_player_eliminated", &rummy::is_player_eliminated,
          py::arg("score"), py::arg("variant"), py::arg("limit_override") = py::none());
    m.def("get_bot_decision", &rummy::get_bot_decision);
    m.def("get_bot_name", &rummy::get_bot_name);

    // ========================================================================
    // SESSION
    // ========================================================================

    py::class_<rummy::GameSession>(m, "GameSession")
        .def(py::init<>())
        .def("create_game", &rummy::GameSession::create_game)
        .def("start_round", &rummy::GameSession::start_round, py::arg("seed") = py::none())
        .def("draw_card", &rummy::GameSession::draw_card)
        .def("discard_card", &rummy::GameSession::discard_card)
        .def("declare", &rummy::GameSession::declare)
        .def("drop", &rummy::GameSession::drop)
        .def("is_bot_turn", &rummy::GameSession::is_bot_turn)
        .def("bot_context", &rummy::GameSession::bot_context)
        .def("execute_bot_turn", &rummy::GameSession::execute_bot_turn)
        .def("phase", &rummy::GameSession::phase)
        .def("players", &rummy::GameSession::players)
        .def("scores", &rummy::GameSession::scores)
        .def("round_results", &rummy::GameSession::round_results)
        .def("winner", &rummy::GameSession::winner)
        .def("current_player", &rummy::GameSession::current_player, py::return_value_policy::reference)
        .def("top_discard", &rummy::GameSession::top_discard)
        .def("player_hand", &rummy::GameSession::player_hand)
        .def("can_draw", &rummy::GameSession::can_draw)
        .def("can_discard", &rummy::GameSession::can_discard);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = rummy::get_version();
    m.attr("__version__") = rummy::get_version();
}
