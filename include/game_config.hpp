/**
 * Rummy Engine - Game Configuration
 *
 * Variant rules and penalty amounts. The engine takes these as plain values;
 * only the console reads them from a file.
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>

namespace rummy {

/**
 * GameConfig - Rules for one game.
 */
struct GameConfig {
    Variant variant = Variant::POINTS;
    std::optional<int> pool_limit;          // Overrides the variant's 101 / 201
    int number_of_deals = 2;                // Deals variant only
    int first_drop_penalty = 20;
    int middle_drop_penalty = 40;
    int invalid_declaration_penalty = MAX_ROUND_POINTS;

    /**
     * Standard amounts for a variant: 20 / 40 / 80, except Pool 201 which
     * uses 25 / 50 / 80.
     */
    static GameConfig defaults_for(Variant variant);

    /**
     * Pool limit in force: the override if set, else the variant's.
     * nullopt for non-pool variants.
     */
    std::optional<int> effective_pool_limit() const;

    /**
     * Penalties non-negative, deals at least one, pool limit positive.
     */
    bool is_valid() const;
};

/**
 * Load a config from a JSON file into `config`.
 *
 * Keys not present keep the defaults of the file's variant. On any failure
 * (missing file, bad JSON, unknown variant, out-of-range amounts) reports to
 * std::cerr and returns false, leaving `config` untouched.
 *
 * Example:
 *   { "variant": "pool201", "first_drop_penalty": 25, "pool_limit": 201 }
 */
bool load_game_config(const std::string& filepath, GameConfig& config);

} // namespace rummy
