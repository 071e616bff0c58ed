/**
 * Rummy Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 * Enum text forms double as the JSON / config spelling.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

namespace rummy {

// ============================================================================
// ENUMS
// ============================================================================

enum class Suit : uint8_t {
    SPADES,
    HEARTS,
    DIAMONDS,
    CLUBS
};

// Ace is always low (A-2-3 is a run, Q-K-A is not)
enum class Rank : uint8_t {
    ACE = 1,
    TWO,
    THREE,
    FOUR,
    FIVE,
    SIX,
    SEVEN,
    EIGHT,
    NINE,
    TEN,
    JACK,
    QUEEN,
    KING
};

enum class JokerType : uint8_t {
    NONE,
    PRINTED,
    WILD
};

enum class MeldType : uint8_t {
    PURE_SEQUENCE,
    SEQUENCE,
    SET
};

enum class Variant : uint8_t {
    POINTS,
    POOL_101,
    POOL_201,
    DEALS
};

enum class BotDifficulty : uint8_t {
    EASY,
    MEDIUM,
    HARD
};

enum class TurnPhase : uint8_t {
    DRAW,
    DISCARD
};

enum class DrawSource : uint8_t {
    DECK,
    DISCARD
};

enum class BotActionType : uint8_t {
    DRAW,
    DISCARD,
    DECLARE,
    DROP
};

enum class RoundOutcome : uint8_t {
    VALID_DECLARATION,
    INVALID_DECLARATION,
    FIRST_DROP,
    MIDDLE_DROP
};

enum class GamePhase : uint8_t {
    SETUP,
    PLAYING,
    ENDED
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using CardID = std::string;      // Unique physical card (e.g., "d1-10H")
using PlayerID = std::string;    // "human", "bot-0", ...
using ScoreMap = std::unordered_map<PlayerID, int>;

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr int CARDS_PER_PLAYER = 13;
constexpr int MIN_MELD_SIZE = 3;
constexpr int MAX_SET_SIZE = 4;
constexpr int MAX_ROUND_POINTS = 80;    // Full-count cap for a losing hand
constexpr int PRINTED_JOKERS_PER_DECK = 2;

constexpr int RANK_COUNT = 13;
constexpr int SUIT_COUNT = 4;

inline int rank_index(Rank rank) {
    return static_cast<int>(rank);
}

inline bool is_sequence_type(MeldType type) {
    return type == MeldType::PURE_SEQUENCE || type == MeldType::SEQUENCE;
}

inline bool is_pool_variant(Variant variant) {
    return variant == Variant::POOL_101 || variant == Variant::POOL_201;
}

inline std::optional<int> pool_limit(Variant variant) {
    switch (variant) {
        case Variant::POOL_101: return 101;
        case Variant::POOL_201: return 201;
        default: return std::nullopt;
    }
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(Suit suit) {
    switch (suit) {
        case Suit::SPADES: return "spades";
        case Suit::HEARTS: return "hearts";
        case Suit::DIAMONDS: return "diamonds";
        case Suit::CLUBS: return "clubs";
        default: return "unknown";
    }
}

inline const char* to_string(Rank rank) {
    switch (rank) {
        case Rank::ACE: return "A";
        case Rank::TWO: return "2";
        case Rank::THREE: return "3";
        case Rank::FOUR: return "4";
        case Rank::FIVE: return "5";
        case Rank::SIX: return "6";
        case Rank::SEVEN: return "7";
        case Rank::EIGHT: return "8";
        case Rank::NINE: return "9";
        case Rank::TEN: return "10";
        case Rank::JACK: return "J";
        case Rank::QUEEN: return "Q";
        case Rank::KING: return "K";
        default: return "?";
    }
}

inline const char* to_string(JokerType type) {
    switch (type) {
        case JokerType::NONE: return "none";
        case JokerType::PRINTED: return "printed";
        case JokerType::WILD: return "wild";
        default: return "unknown";
    }
}

inline const char* to_string(MeldType type) {
    switch (type) {
        case MeldType::PURE_SEQUENCE: return "pure-sequence";
        case MeldType::SEQUENCE: return "sequence";
        case MeldType::SET: return "set";
        default: return "unknown";
    }
}

inline const char* to_string(Variant variant) {
    switch (variant) {
        case Variant::POINTS: return "points";
        case Variant::POOL_101: return "pool101";
        case Variant::POOL_201: return "pool201";
        case Variant::DEALS: return "deals";
        default: return "unknown";
    }
}

inline const char* to_string(BotDifficulty difficulty) {
    switch (difficulty) {
        case BotDifficulty::EASY: return "easy";
        case BotDifficulty::MEDIUM: return "medium";
        case BotDifficulty::HARD: return "hard";
        default: return "unknown";
    }
}

inline const char* to_string(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::DRAW: return "draw";
        case TurnPhase::DISCARD: return "discard";
        default: return "unknown";
    }
}

inline const char* to_string(DrawSource source) {
    switch (source) {
        case DrawSource::DECK: return "deck";
        case DrawSource::DISCARD: return "discard";
        default: return "unknown";
    }
}

inline const char* to_string(BotActionType action) {
    switch (action) {
        case BotActionType::DRAW: return "draw";
        case BotActionType::DISCARD: return "discard";
        case BotActionType::DECLARE: return "declare";
        case BotActionType::DROP: return "drop";
        default: return "unknown";
    }
}

inline const char* to_string(RoundOutcome outcome) {
    switch (outcome) {
        case RoundOutcome::VALID_DECLARATION: return "valid";
        case RoundOutcome::INVALID_DECLARATION: return "invalid";
        case RoundOutcome::FIRST_DROP: return "drop-first";
        case RoundOutcome::MIDDLE_DROP: return "drop-middle";
        default: return "unknown";
    }
}

inline const char* to_string(GamePhase phase) {
    switch (phase) {
        case GamePhase::SETUP: return "setup";
        case GamePhase::PLAYING: return "playing";
        case GamePhase::ENDED: return "ended";
        default: return "unknown";
    }
}

// Text -> enum. Unknown text yields nullopt.
std::optional<Suit> parse_suit(const std::string& s);
std::optional<Rank> parse_rank(const std::string& s);
std::optional<JokerType> parse_joker_type(const std::string& s);
std::optional<MeldType> parse_meld_type(const std::string& s);
std::optional<Variant> parse_variant(const std::string& s);
std::optional<BotDifficulty> parse_difficulty(const std::string& s);
std::optional<TurnPhase> parse_turn_phase(const std::string& s);
std::optional<DrawSource> parse_draw_source(const std::string& s);
std::optional<BotActionType> parse_bot_action(const std::string& s);
std::optional<RoundOutcome> parse_round_outcome(const std::string& s);

} // namespace rummy
