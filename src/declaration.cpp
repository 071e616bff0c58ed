/**
 * Rummy Engine - Declaration Validator Implementation
 */

#include "declaration.hpp"
#include "hand.hpp"
#include "hand_arranger.hpp"
#include <unordered_set>

namespace rummy {

namespace {

void append_well_formed(std::vector<Card>& out, const std::vector<Card>& cards) {
    for (const auto& card : cards) {
        if (card.is_well_formed()) {
            out.push_back(card);
        }
    }
}

std::string join_ids(const std::vector<Card>& cards) {
    std::string ids;
    for (size_t i = 0; i < cards.size(); i++) {
        if (i > 0) ids += ", ";
        ids += cards[i].id;
    }
    return ids;
}

} // namespace

DeclarationResult validate_declaration(const std::vector<Meld>& melds,
                                       const std::vector<Card>& extra_deadwood) {
    DeclarationResult result;

    // Pass 1: split into sequences, sets and broken groups
    std::vector<Meld> sequences;
    std::vector<Meld> sets;
    std::vector<Card> invalid_cards;

    for (const auto& meld : melds) {
        if (validate_meld(meld)) {
            Meld counted = meld;
            counted.is_pure = meld.type == MeldType::PURE_SEQUENCE
                || (meld.type == MeldType::SEQUENCE && is_pure_sequence(meld.cards));
            if (counted.is_sequence()) {
                sequences.push_back(std::move(counted));
            } else {
                sets.push_back(std::move(counted));
            }
        } else {
            append_well_formed(invalid_cards, meld.cards);
            result.errors.push_back("Invalid meld: " + join_ids(meld.cards));
        }
    }

    int pure_count = 0;
    for (const auto& seq : sequences) {
        if (seq.is_pure) pure_count++;
    }
    result.has_pure_sequence = pure_count >= 1;
    result.has_minimum_sequences = sequences.size() >= 2;

    // Pass 2: sets only stand once the sequence requirement is met
    result.melds = sequences;
    std::vector<Card> set_cards_as_deadwood;
    if (result.has_minimum_sequences) {
        result.melds.insert(result.melds.end(), sets.begin(), sets.end());
    } else {
        for (const auto& set : sets) {
            set_cards_as_deadwood.insert(set_cards_as_deadwood.end(),
                                         set.cards.begin(), set.cards.end());
        }
        if (!sets.empty()) {
            result.errors.push_back("Sets are not valid without 2 sequences - they count as deadwood");
        }
    }

    append_well_formed(result.deadwood, extra_deadwood);
    result.deadwood.insert(result.deadwood.end(), invalid_cards.begin(), invalid_cards.end());
    result.deadwood.insert(result.deadwood.end(),
                           set_cards_as_deadwood.begin(), set_cards_as_deadwood.end());
    result.deadwood_points = calculate_deadwood_points(result.deadwood);
    result.all_cards_melded = result.deadwood.empty();

    if (!result.has_pure_sequence) {
        result.errors.push_back("Declaration must have at least one pure sequence (without jokers)");
    }
    if (!result.has_minimum_sequences) {
        result.errors.push_back("Declaration must have at least 2 sequences");
    }
    if (!result.all_cards_melded) {
        result.errors.push_back(std::to_string(result.deadwood.size()) + " cards are not melded ("
                                + std::to_string(result.deadwood_points) + " points)");
    }

    // Card accounting
    size_t total_cards = result.deadwood.size();
    std::unordered_set<CardID> seen;
    std::vector<CardID> duplicates;
    auto track = [&](const Card& card) {
        if (!seen.insert(card.id).second) {
            duplicates.push_back(card.id);
        }
    };
    for (const auto& meld : result.melds) {
        total_cards += meld.cards.size();
        for (const auto& card : meld.cards) track(card);
    }
    for (const auto& card : result.deadwood) track(card);

    for (const auto& id : duplicates) {
        result.errors.push_back("Card used more than once: " + id);
    }
    if (total_cards != static_cast<size_t>(CARDS_PER_PLAYER)) {
        result.errors.push_back("Expected " + std::to_string(CARDS_PER_PLAYER) + " cards, got "
                                + std::to_string(total_cards));
    }

    result.is_valid = result.has_pure_sequence && result.has_minimum_sequences
        && result.all_cards_melded && result.errors.empty();
    return result;
}

bool can_declare(const std::vector<Card>& cards) {
    if (filter_valid_cards(cards).size() != static_cast<size_t>(CARDS_PER_PLAYER)) {
        return false;
    }
    return auto_arrange_hand(cards).can_declare;
}

std::vector<std::string> get_declaration_hint(const std::vector<Card>& cards) {
    std::vector<std::string> hints;
    if (cards.empty()) {
        return hints;
    }

    HandAnalysis analysis = auto_arrange_hand(cards);

    if (!analysis.has_pure_sequence) {
        hints.push_back("You need at least one pure sequence (no jokers)");
    }
    if (analysis.sequence_count < 2) {
        hints.push_back("You need at least 2 sequences (you have "
                        + std::to_string(analysis.sequence_count) + ")");
    }
    if (!analysis.deadwood.empty()) {
        hints.push_back("You have " + std::to_string(analysis.deadwood.size())
                        + " unmelded cards worth " + std::to_string(analysis.deadwood_points)
                        + " points");
    }
    return hints;
}

} // namespace rummy
