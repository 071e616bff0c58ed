/**
 * Rummy Engine - JSON Serialization
 *
 * nlohmann/json converters for the engine's value types, found by ADL so
 * callers can write `json j = card;` and `j.get<Card>()`.
 *
 * Enums are written as their to_string() text. Card values are recomputed
 * on read, never trusted from input. A card that cannot be read comes back
 * with an empty id, which every engine entry point filters out.
 */

#pragma once

#include "bot.hpp"
#include "declaration.hpp"
#include "game_config.hpp"
#include "hand_arranger.hpp"
#include "scoring.hpp"
#include <nlohmann/json.hpp>

namespace rummy {

void to_json(nlohmann::json& j, const Card& card);
void from_json(const nlohmann::json& j, Card& card);

void to_json(nlohmann::json& j, const Meld& meld);
void from_json(const nlohmann::json& j, Meld& meld);

void to_json(nlohmann::json& j, const DeclarationResult& result);
void to_json(nlohmann::json& j, const HandAnalysis& analysis);

void to_json(nlohmann::json& j, const BotDecision& decision);
void from_json(const nlohmann::json& j, BotDecision& decision);

void to_json(nlohmann::json& j, const RoundResult& result);
void from_json(const nlohmann::json& j, RoundResult& result);

void to_json(nlohmann::json& j, const GameConfig& config);
void from_json(const nlohmann::json& j, GameConfig& config);

/**
 * Parse a card array, dropping entries that are not well-formed.
 */
std::vector<Card> cards_from_json(const nlohmann::json& j);

} // namespace rummy
