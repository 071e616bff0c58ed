/**
 * Rummy Engine - Enum parsing
 */

#include "types.hpp"
#include <algorithm>
#include <cctype>

namespace rummy {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Linear scan over [first, last] comparing against to_string().
template<typename E>
std::optional<E> parse_enum(const std::string& s, int first, int last) {
    std::string needle = lowercase(s);
    for (int i = first; i <= last; i++) {
        E value = static_cast<E>(i);
        if (lowercase(to_string(value)) == needle) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<Suit> parse_suit(const std::string& s) {
    // Accept single-letter suit codes used in card labels
    if (s.size() == 1) {
        switch (std::toupper(static_cast<unsigned char>(s[0]))) {
            case 'S': return Suit::SPADES;
            case 'H': return Suit::HEARTS;
            case 'D': return Suit::DIAMONDS;
            case 'C': return Suit::CLUBS;
            default: return std::nullopt;
        }
    }
    return parse_enum<Suit>(s, 0, SUIT_COUNT - 1);
}

std::optional<Rank> parse_rank(const std::string& s) {
    if (lowercase(s) == "t") {
        return Rank::TEN;
    }
    return parse_enum<Rank>(s, rank_index(Rank::ACE), rank_index(Rank::KING));
}

std::optional<JokerType> parse_joker_type(const std::string& s) {
    return parse_enum<JokerType>(s, 0, static_cast<int>(JokerType::WILD));
}

std::optional<MeldType> parse_meld_type(const std::string& s) {
    return parse_enum<MeldType>(s, 0, static_cast<int>(MeldType::SET));
}

std::optional<Variant> parse_variant(const std::string& s) {
    return parse_enum<Variant>(s, 0, static_cast<int>(Variant::DEALS));
}

std::optional<BotDifficulty> parse_difficulty(const std::string& s) {
    return parse_enum<BotDifficulty>(s, 0, static_cast<int>(BotDifficulty::HARD));
}

std::optional<TurnPhase> parse_turn_phase(const std::string& s) {
    return parse_enum<TurnPhase>(s, 0, static_cast<int>(TurnPhase::DISCARD));
}

std::optional<DrawSource> parse_draw_source(const std::string& s) {
    return parse_enum<DrawSource>(s, 0, static_cast<int>(DrawSource::DISCARD));
}

std::optional<BotActionType> parse_bot_action(const std::string& s) {
    return parse_enum<BotActionType>(s, 0, static_cast<int>(BotActionType::DROP));
}

std::optional<RoundOutcome> parse_round_outcome(const std::string& s) {
    return parse_enum<RoundOutcome>(s, 0, static_cast<int>(RoundOutcome::MIDDLE_DROP));
}

} // namespace rummy
