/**
 * Rummy Engine - Declaration Validator
 *
 * Applies the hand-level Indian Rummy rules to a full arrangement:
 * 1. At least one pure sequence
 * 2. At least two sequences in total
 * 3. Sets only count once rule 2 is met; otherwise their cards are deadwood
 * 4. Every one of the 13 cards melded
 *
 * Results are advisory. Scoring consequences are the caller's business.
 */

#pragma once

#include "meld.hpp"
#include <string>
#include <vector>

namespace rummy {

/**
 * DeclarationResult - Verdict on one arrangement.
 *
 * Built fresh on every call. errors holds human-readable reasons; it is
 * empty exactly when is_valid is true.
 */
struct DeclarationResult {
    bool is_valid = false;
    bool has_pure_sequence = false;
    bool has_minimum_sequences = false;
    bool all_cards_melded = false;

    std::vector<Meld> melds;        // Melds that count
    std::vector<Card> deadwood;
    int deadwood_points = 0;

    std::vector<std::string> errors;
};

/**
 * Validate a declaration.
 *
 * @param melds Groups as arranged by the player
 * @param extra_deadwood Cards the player left outside any group
 */
DeclarationResult validate_declaration(const std::vector<Meld>& melds,
                                       const std::vector<Card>& extra_deadwood = {});

/**
 * Whether a 13-card hand can be declared as-is (auto-arranged).
 */
bool can_declare(const std::vector<Card>& cards);

/**
 * Hints about what the hand still lacks. Empty for an empty hand.
 */
std::vector<std::string> get_declaration_hint(const std::vector<Card>& cards);

} // namespace rummy
