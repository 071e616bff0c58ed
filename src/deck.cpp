/**
 * Rummy Engine - Deck Management Implementation
 */

#include "deck.hpp"
#include <iostream>

namespace rummy {

int decks_for_players(int player_count) {
    return player_count <= 2 ? 1 : 2;
}

std::vector<Card> create_decks(int player_count) {
    static const Suit suits[] = {Suit::SPADES, Suit::HEARTS, Suit::DIAMONDS, Suit::CLUBS};

    int deck_count = decks_for_players(player_count);
    std::vector<Card> cards;
    cards.reserve(deck_count * (SUIT_COUNT * RANK_COUNT + PRINTED_JOKERS_PER_DECK));

    for (int d = 0; d < deck_count; d++) {
        std::string prefix = "d" + std::to_string(d) + "-";

        for (Suit suit : suits) {
            for (int r = rank_index(Rank::ACE); r <= rank_index(Rank::KING); r++) {
                Card card = Card::make("", suit, static_cast<Rank>(r));
                card.id = prefix + card_label(card);
                cards.push_back(card);
            }
        }

        for (int j = 0; j < PRINTED_JOKERS_PER_DECK; j++) {
            cards.push_back(Card::printed_joker(prefix + "JKR" + std::to_string(j + 1)));
        }
    }

    return cards;
}

std::vector<Card> apply_wild_rank(const std::vector<Card>& cards, Rank wild_rank) {
    std::vector<Card> tagged;
    tagged.reserve(cards.size());
    for (const auto& card : cards) {
        if (!card.is_joker() && card.rank == wild_rank) {
            tagged.push_back(card.with_joker_type(JokerType::WILD));
        } else {
            tagged.push_back(card);
        }
    }
    return tagged;
}

std::optional<DealResult> deal_cards(const std::vector<Card>& deck,
                                     const std::vector<PlayerID>& player_ids,
                                     int cards_per_player) {
    size_t needed = player_ids.size() * static_cast<size_t>(cards_per_player) + 2;
    if (player_ids.empty() || cards_per_player <= 0 || deck.size() < needed) {
        std::cerr << "[Deck] Cannot deal " << cards_per_player << " cards to "
                  << player_ids.size() << " players from " << deck.size() << " cards" << std::endl;
        return std::nullopt;
    }

    DealResult result;
    size_t next = 0;

    for (int round = 0; round < cards_per_player; round++) {
        for (const auto& player_id : player_ids) {
            result.hands[player_id].push_back(deck[next++]);
        }
    }

    // Cut for the wild rank
    Card cut = deck[next++];
    result.wild_rank = cut.is_printed_joker() ? Rank::ACE : cut.rank;

    for (auto& entry : result.hands) {
        entry.second = apply_wild_rank(entry.second, result.wild_rank);
    }

    // Remaining deck: index `next` is the top of the draw pile
    std::vector<Card> rest(deck.begin() + next, deck.end());
    rest = apply_wild_rank(rest, result.wild_rank);

    Card discard_start = rest.front();
    rest.erase(rest.begin());

    // Pile top is the back of the vector
    for (auto it = rest.rbegin(); it != rest.rend(); ++it) {
        result.draw_pile.add_to_top(*it);
    }

    Card tagged_cut = cut.is_joker() ? cut : apply_wild_rank({cut}, result.wild_rank).front();
    result.wild_joker_card = tagged_cut;
    result.draw_pile.add_to_bottom(tagged_cut);

    result.discard_pile.add_to_top(discard_start);
    return result;
}

} // namespace rummy
