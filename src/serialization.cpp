/**
 * Rummy Engine - JSON Serialization Implementation
 */

#include "serialization.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace rummy {

namespace {

// Optional enum field: absent or unreadable gives nullopt
template<typename E, typename Parser>
std::optional<E> enum_field(const json& j, const char* key, Parser parse) {
    if (!j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return parse(j[key].get<std::string>());
}

std::optional<Rank> read_rank(const json& j) {
    if (!j.contains("rank")) {
        return std::nullopt;
    }
    const json& r = j["rank"];
    if (r.is_number_integer()) {
        int value = r.get<int>();
        if (value < rank_index(Rank::ACE) || value > rank_index(Rank::KING)) {
            return std::nullopt;
        }
        return static_cast<Rank>(value);
    }
    if (r.is_string()) {
        return parse_rank(r.get<std::string>());
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// CARD / MELD
// ============================================================================

void to_json(json& j, const Card& card) {
    j = json{
        {"id", card.id},
        {"suit", to_string(card.suit)},
        {"rank", to_string(card.rank)},
        {"joker_type", to_string(card.joker_type)},
        {"value", card.value}
    };
}

void from_json(const json& j, Card& card) {
    card = Card();
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        return;
    }

    JokerType joker_type = enum_field<JokerType>(j, "joker_type", parse_joker_type)
                               .value_or(JokerType::NONE);
    std::string id = j["id"].get<std::string>();

    if (joker_type == JokerType::PRINTED) {
        card = Card::printed_joker(id);
        return;
    }

    auto suit = enum_field<Suit>(j, "suit", parse_suit);
    auto rank = read_rank(j);
    if (!suit.has_value() || !rank.has_value()) {
        return;
    }
    card = Card(id, *suit, *rank, joker_type);
}

std::vector<Card> cards_from_json(const json& j) {
    std::vector<Card> cards;
    if (!j.is_array()) {
        return cards;
    }
    for (const auto& item : j) {
        Card card = item.get<Card>();
        if (card.is_well_formed()) {
            cards.push_back(std::move(card));
        }
    }
    return cards;
}

void to_json(json& j, const Meld& meld) {
    j = json{
        {"type", to_string(meld.type)},
        {"cards", meld.cards},
        {"is_pure", meld.is_pure}
    };
}

void from_json(const json& j, Meld& meld) {
    auto type = enum_field<MeldType>(j, "type", parse_meld_type);
    if (!type.has_value()) {
        throw std::invalid_argument("meld has no readable type");
    }
    meld = Meld(*type, j.contains("cards") ? cards_from_json(j["cards"]) : std::vector<Card>{});
}

// ============================================================================
// RESULTS
// ============================================================================

void to_json(json& j, const DeclarationResult& result) {
    j = json{
        {"is_valid", result.is_valid},
        {"has_pure_sequence", result.has_pure_sequence},
        {"has_minimum_sequences", result.has_minimum_sequences},
        {"all_cards_melded", result.all_cards_melded},
        {"melds", result.melds},
        {"deadwood", result.deadwood},
        {"deadwood_points", result.deadwood_points},
        {"errors", result.errors}
    };
}

void to_json(json& j, const HandAnalysis& analysis) {
    j = json{
        {"melds", analysis.melds},
        {"deadwood", analysis.deadwood},
        {"deadwood_points", analysis.deadwood_points},
        {"has_pure_sequence", analysis.has_pure_sequence},
        {"sequence_count", analysis.sequence_count},
        {"can_declare", analysis.can_declare}
    };
}

void to_json(json& j, const BotDecision& decision) {
    j = json{
        {"action", to_string(decision.action)},
        {"thinking_time_ms", decision.thinking_time_ms}
    };
    if (decision.source.has_value()) {
        j["source"] = to_string(*decision.source);
    }
    if (decision.card.has_value()) {
        j["card"] = *decision.card;
    }
    if (!decision.melds.empty()) {
        j["melds"] = decision.melds;
    }
}

void from_json(const json& j, BotDecision& decision) {
    auto action = enum_field<BotActionType>(j, "action", parse_bot_action);
    if (!action.has_value()) {
        throw std::invalid_argument("bot decision has no readable action");
    }

    decision = BotDecision();
    decision.action = *action;
    decision.thinking_time_ms = j.value("thinking_time_ms", 0);
    decision.source = enum_field<DrawSource>(j, "source", parse_draw_source);
    if (j.contains("card")) {
        Card card = j["card"].get<Card>();
        if (card.is_well_formed()) {
            decision.card = card;
        }
    }
    if (j.contains("melds") && j["melds"].is_array()) {
        decision.melds = j["melds"].get<std::vector<Meld>>();
    }
}

void to_json(json& j, const RoundResult& result) {
    json scores = json::object();
    for (const auto& [player, points] : result.scores) {
        scores[player] = points;
    }
    j = json{
        {"round_number", result.round_number},
        {"player_id", result.player_id},
        {"player_name", result.player_name},
        {"outcome", to_string(result.outcome)},
        {"scores", scores}
    };
}

void from_json(const json& j, RoundResult& result) {
    auto outcome = enum_field<RoundOutcome>(j, "outcome", parse_round_outcome);
    if (!outcome.has_value()) {
        throw std::invalid_argument("round result has no readable outcome");
    }

    result = RoundResult();
    result.round_number = j.value("round_number", 0);
    result.player_id = j.value("player_id", "");
    result.player_name = j.value("player_name", "");
    result.outcome = *outcome;
    if (j.contains("scores") && j["scores"].is_object()) {
        for (const auto& item : j["scores"].items()) {
            result.scores[item.key()] = item.value().get<int>();
        }
    }
}

// ============================================================================
// CONFIG
// ============================================================================

void to_json(json& j, const GameConfig& config) {
    j = json{
        {"variant", to_string(config.variant)},
        {"number_of_deals", config.number_of_deals},
        {"first_drop_penalty", config.first_drop_penalty},
        {"middle_drop_penalty", config.middle_drop_penalty},
        {"invalid_declaration_penalty", config.invalid_declaration_penalty}
    };
    if (config.pool_limit.has_value()) {
        j["pool_limit"] = *config.pool_limit;
    }
}

void from_json(const json& j, GameConfig& config) {
    Variant variant = Variant::POINTS;
    if (j.contains("variant")) {
        auto parsed = enum_field<Variant>(j, "variant", parse_variant);
        if (!parsed.has_value()) {
            throw std::invalid_argument("unknown variant: " + j["variant"].dump());
        }
        variant = *parsed;
    }

    GameConfig loaded = GameConfig::defaults_for(variant);
    loaded.number_of_deals = j.value("number_of_deals", loaded.number_of_deals);
    loaded.first_drop_penalty = j.value("first_drop_penalty", loaded.first_drop_penalty);
    loaded.middle_drop_penalty = j.value("middle_drop_penalty", loaded.middle_drop_penalty);
    loaded.invalid_declaration_penalty =
        j.value("invalid_declaration_penalty", loaded.invalid_declaration_penalty);
    if (j.contains("pool_limit") && !j["pool_limit"].is_null()) {
        loaded.pool_limit = j["pool_limit"].get<int>();
    }
    config = loaded;
}

} // namespace rummy
