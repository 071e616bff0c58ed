/**
 * Rummy Engine - Game Configuration Implementation
 *
 * Loads configs from JSON files using nlohmann/json.
 */

#include "game_config.hpp"
#include "serialization.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace rummy {

GameConfig GameConfig::defaults_for(Variant variant) {
    GameConfig config;
    config.variant = variant;
    if (variant == Variant::POOL_201) {
        config.first_drop_penalty = 25;
        config.middle_drop_penalty = 50;
    }
    return config;
}

std::optional<int> GameConfig::effective_pool_limit() const {
    if (!is_pool_variant(variant)) {
        return std::nullopt;
    }
    if (pool_limit.has_value()) {
        return pool_limit;
    }
    return rummy::pool_limit(variant);
}

bool GameConfig::is_valid() const {
    if (first_drop_penalty < 0 || middle_drop_penalty < 0 || invalid_declaration_penalty < 0) {
        return false;
    }
    if (number_of_deals < 1) {
        return false;
    }
    return !pool_limit.has_value() || *pool_limit > 0;
}

bool load_game_config(const std::string& filepath, GameConfig& config) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[GameConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        if (!data.is_object()) {
            std::cerr << "[GameConfig] Expected a JSON object in " << filepath << std::endl;
            return false;
        }

        GameConfig loaded = data.get<GameConfig>();
        if (!loaded.is_valid()) {
            std::cerr << "[GameConfig] Out-of-range values in " << filepath << std::endl;
            return false;
        }

        config = loaded;
        std::cout << "[GameConfig] Loaded " << to_string(config.variant) << " rules from "
                  << filepath << std::endl;
        return true;

    } catch (const json::parse_error& e) {
        std::cerr << "[GameConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[GameConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

} // namespace rummy
