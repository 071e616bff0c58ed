/**
 * Rummy Engine - C++ Implementation
 *
 * Rules and decision engine for Indian Rummy: meld and declaration
 * validation, hand arrangement, scoring and rule-driven bots.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"

// Data structures
#include "card.hpp"
#include "hand.hpp"
#include "pile.hpp"
#include "deck.hpp"

// Rules
#include "meld.hpp"
#include "declaration.hpp"
#include "hand_arranger.hpp"
#include "scoring.hpp"

// Opponents
#include "bot.hpp"

// Game lifecycle
#include "game_config.hpp"
#include "game_session.hpp"

namespace rummy {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace rummy
