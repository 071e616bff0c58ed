/**
 * Rummy Engine - Game Session Implementation
 */

#include "game_session.hpp"
#include "hand.hpp"
#include "xray_logger.hpp"
#include <chrono>

namespace rummy {

GameSession::GameSession() {
    auto seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    rng_.seed(static_cast<unsigned int>(seed));
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool GameSession::create_game(const std::string& human_name,
                              int bot_count,
                              BotDifficulty difficulty,
                              const GameConfig& config) {
    if (bot_count < MIN_BOTS || bot_count > MAX_BOTS || !config.is_valid()) {
        return false;
    }

    config_ = config;
    players_.clear();
    scores_.clear();
    round_results_.clear();
    rounds_played_ = 0;
    winner_.reset();
    last_declaration_.reset();
    round_.reset();

    players_.push_back(PlayerInfo{"human", human_name.empty() ? "You" : human_name, false, std::nullopt});
    for (int i = 0; i < bot_count; i++) {
        players_.push_back(PlayerInfo{"bot-" + std::to_string(i), get_bot_name(difficulty, i), true, difficulty});
    }
    for (const auto& player : players_) {
        scores_[player.id] = 0;
    }

    phase_ = GamePhase::SETUP;
    return true;
}

bool GameSession::start_round(std::optional<uint32_t> seed) {
    if (players_.empty() || phase_ == GamePhase::ENDED || is_round_in_progress()) {
        return false;
    }

    std::vector<PlayerID> seats;
    for (const auto& player : players_) {
        if (!is_eliminated(player.id)) {
            seats.push_back(player.id);
        }
    }
    if (seats.size() < 2) {
        return false;
    }

    if (seed.has_value()) {
        rng_.seed(*seed);
    }

    std::vector<Card> deck = create_decks(static_cast<int>(seats.size()));
    shuffle_cards(deck, rng_);
    auto deal = deal_cards(deck, seats);
    if (!deal.has_value()) {
        return false;
    }

    int n = static_cast<int>(seats.size());
    RoundState round;
    round.round_number = rounds_played_ + 1;
    round.seats = seats;
    round.dealer_index = rounds_played_ % n;
    round.current_index = (round.dealer_index + 1) % n;
    round.hands = std::move(deal->hands);
    round.draw_pile = std::move(deal->draw_pile);
    round.discard_pile = std::move(deal->discard_pile);
    round.discard_history = round.discard_pile.cards;
    round.wild_joker_card = deal->wild_joker_card;
    round.wild_rank = deal->wild_rank;

    round_ = std::move(round);
    phase_ = GamePhase::PLAYING;

    if (xray_) {
        xray_->log_round_start(round_->round_number, round_->seats[round_->dealer_index]);
        xray_->log_state(*this);
    }
    return true;
}

// ============================================================================
// TURN ACTIONS
// ============================================================================

std::optional<Card> GameSession::draw_card(DrawSource source) {
    if (!can_draw()) {
        return std::nullopt;
    }

    RoundState& round = *round_;
    std::optional<Card> drawn;

    if (source == DrawSource::DECK) {
        if (round.draw_pile.is_empty()) {
            refill_draw_pile(round.draw_pile, round.discard_pile, rng_);
        }
        drawn = round.draw_pile.draw_top();
    } else {
        drawn = round.discard_pile.draw_top();
        if (drawn.has_value()) {
            round.picked_up_id = drawn->id;
        }
    }

    if (!drawn.has_value()) {
        return std::nullopt;
    }

    const PlayerID player_id = round.current_player_id();
    current_hand().push_back(*drawn);
    round.turn_phase = TurnPhase::DISCARD;
    round.has_drawn.insert(player_id);

    log_action(player_id, std::string("DRAW ") + to_string(source) + " -> " + card_label(*drawn));
    return drawn;
}

bool GameSession::discard_card(const CardID& card_id) {
    if (!can_discard()) {
        return false;
    }

    RoundState& round = *round_;
    std::vector<Card>& hand = current_hand();
    if (round.picked_up_id.has_value() && *round.picked_up_id == card_id && hand.size() > 1) {
        return false;
    }

    const Card* card = find_card(hand, card_id);
    if (card == nullptr) {
        return false;
    }

    Card discarded = *card;
    hand = remove_card_from_hand(hand, card_id);
    round.discard_pile.add_to_top(discarded);
    round.discard_history.push_back(discarded);

    const PlayerID player_id = round.current_player_id();
    advance_turn();
    log_action(player_id, "DISCARD " + card_label(discarded));
    return true;
}

std::optional<RoundResult> GameSession::declare(const std::vector<Meld>& melds, const CardID& finish_card_id) {
    if (!can_discard()) {
        return std::nullopt;
    }

    RoundState& round = *round_;
    std::vector<Card>& hand = current_hand();
    const Card* finish = find_card(hand, finish_card_id);
    if (finish == nullptr) {
        return std::nullopt;
    }
    Card finish_card = *finish;
    std::vector<Card> kept = remove_card_from_hand(hand, finish_card_id);

    std::vector<Card> melded;
    for (const auto& meld : melds) {
        for (const auto& card : meld.cards) {
            if (find_card(kept, card.id) == nullptr) {
                return std::nullopt;
            }
            melded.push_back(card);
        }
    }

    DeclarationResult verdict = validate_declaration(melds, exclude_cards(kept, melded));
    last_declaration_ = verdict;

    hand = kept;
    round.discard_pile.add_to_top(finish_card);
    round.discard_history.push_back(finish_card);

    const PlayerID player_id = round.current_player_id();
    RoundOutcome outcome = verdict.is_valid ? RoundOutcome::VALID_DECLARATION
                                            : RoundOutcome::INVALID_DECLARATION;

    log_action(player_id, std::string("DECLARE ") + to_string(outcome) + " (finish " + card_label(finish_card) + ")");

    ScoreMap round_scores = calculate_round_scores(round.hands, player_id, outcome, config_.variant,
                                                   config_.first_drop_penalty,
                                                   config_.middle_drop_penalty,
                                                   config_.invalid_declaration_penalty);
    RoundResult result = record_result(player_id, outcome, round_scores);

    if (verdict.is_valid) {
        end_round(player_id, "Valid declaration");
    } else {
        end_round(std::nullopt, "Invalid declaration");
    }
    return result;
}

std::optional<RoundResult> GameSession::drop() {
    if (!is_round_in_progress() || phase_ != GamePhase::PLAYING) {
        return std::nullopt;
    }

    RoundState& round = *round_;
    const PlayerID player_id = round.current_player_id();
    RoundOutcome outcome = round.has_drawn.count(player_id) > 0 ? RoundOutcome::MIDDLE_DROP
                                                                 : RoundOutcome::FIRST_DROP;

    log_action(player_id, std::string("DROP ") + to_string(outcome));

    ScoreMap round_scores = calculate_round_scores(round.hands, player_id, outcome, config_.variant,
                                                   config_.first_drop_penalty,
                                                   config_.middle_drop_penalty,
                                                   config_.invalid_declaration_penalty);
    RoundResult result = record_result(player_id, outcome, round_scores);

    round.hands.erase(player_id);
    if (round.players_in_play() <= 1) {
        std::optional<PlayerID> last;
        if (!round.hands.empty()) {
            last = round.hands.begin()->first;
        }
        end_round(last, "Last player standing");
    } else {
        advance_turn();
    }
    return result;
}

// ============================================================================
// BOTS
// ============================================================================

bool GameSession::is_bot_turn() const {
    const PlayerInfo* player = current_player();
    return player != nullptr && player->is_bot && phase_ == GamePhase::PLAYING;
}

std::optional<BotContext> GameSession::bot_context() const {
    if (!is_round_in_progress()) {
        return std::nullopt;
    }

    const RoundState& round = *round_;
    const PlayerID& player_id = round.current_player_id();

    BotContext context;
    context.hand = player_hand(player_id);
    context.top_discard = top_discard();
    context.discard_history = round.discard_history;
    context.turn_phase = round.turn_phase;
    context.is_first_turn = round.has_drawn.count(player_id) == 0;
    auto score = scores_.find(player_id);
    context.current_score = score != scores_.end() ? score->second : 0;
    context.pool_limit = config_.effective_pool_limit();
    context.first_drop_penalty = config_.first_drop_penalty;
    context.picked_up_id = round.picked_up_id;
    return context;
}

std::optional<BotDecision> GameSession::execute_bot_turn() {
    if (!is_bot_turn()) {
        return std::nullopt;
    }
    auto context = bot_context();
    if (!context.has_value()) {
        return std::nullopt;
    }

    BotDifficulty difficulty = current_player()->difficulty.value_or(BotDifficulty::MEDIUM);
    BotDecision decision = get_bot_decision(difficulty, *context);

    switch (decision.action) {
        case BotActionType::DRAW: {
            DrawSource source = decision.source.value_or(DrawSource::DECK);
            if (draw_card(source).has_value()) {
                return decision;
            }
            // Empty discard pile: fall back to the deck
            if (source == DrawSource::DISCARD && draw_card(DrawSource::DECK).has_value()) {
                return BotDecision::draw(DrawSource::DECK, decision.thinking_time_ms);
            }
            return std::nullopt;
        }

        case BotActionType::DISCARD:
            if (decision.card.has_value() && discard_card(decision.card->id)) {
                return decision;
            }
            return std::nullopt;

        case BotActionType::DECLARE:
            if (decision.card.has_value() && declare(decision.melds, decision.card->id).has_value()) {
                return decision;
            }
            if (decision.card.has_value() && discard_card(decision.card->id)) {
                return BotDecision::discard(*decision.card, decision.thinking_time_ms);
            }
            return std::nullopt;

        case BotActionType::DROP:
            if (drop().has_value()) {
                return decision;
            }
            return std::nullopt;
    }
    return std::nullopt;
}

// ============================================================================
// QUERIES
// ============================================================================

const PlayerInfo* GameSession::find_player(const PlayerID& player_id) const {
    for (const auto& player : players_) {
        if (player.id == player_id) {
            return &player;
        }
    }
    return nullptr;
}

const PlayerInfo* GameSession::current_player() const {
    if (!is_round_in_progress()) {
        return nullptr;
    }
    return find_player(round_->current_player_id());
}

std::optional<Card> GameSession::top_discard() const {
    if (!round_.has_value()) {
        return std::nullopt;
    }
    const Card* top = round_->discard_pile.peek_top();
    if (top == nullptr) {
        return std::nullopt;
    }
    return *top;
}

std::vector<Card> GameSession::player_hand(const PlayerID& player_id) const {
    if (!round_.has_value()) {
        return {};
    }
    auto it = round_->hands.find(player_id);
    if (it == round_->hands.end()) {
        return {};
    }
    return it->second;
}

bool GameSession::is_eliminated(const PlayerID& player_id) const {
    auto it = scores_.find(player_id);
    int score = it != scores_.end() ? it->second : 0;
    return is_player_eliminated(score, config_.variant, config_.pool_limit);
}

bool GameSession::can_draw() const {
    return is_round_in_progress() && phase_ == GamePhase::PLAYING
        && round_->turn_phase == TurnPhase::DRAW;
}

bool GameSession::can_discard() const {
    return is_round_in_progress() && phase_ == GamePhase::PLAYING
        && round_->turn_phase == TurnPhase::DISCARD;
}

// ============================================================================
// INTERNALS
// ============================================================================

std::vector<Card>& GameSession::current_hand() {
    return round_->hands[round_->current_player_id()];
}

void GameSession::advance_turn() {
    RoundState& round = *round_;
    int n = static_cast<int>(round.seats.size());
    for (int step = 1; step <= n; step++) {
        int next = (round.current_index + step) % n;
        if (round.is_in_play(round.seats[next])) {
            round.current_index = next;
            break;
        }
    }
    round.turn_phase = TurnPhase::DRAW;
    round.picked_up_id.reset();
    round.turn_count++;
}

RoundResult GameSession::record_result(const PlayerID& player_id,
                                       RoundOutcome outcome,
                                       const ScoreMap& round_scores) {
    RoundResult result;
    result.round_number = round_->round_number;
    result.player_id = player_id;
    const PlayerInfo* player = find_player(player_id);
    result.player_name = player != nullptr ? player->name : "Unknown";
    result.outcome = outcome;
    result.scores = round_scores;

    scores_ = update_cumulative_scores(scores_, round_scores);
    round_results_.push_back(result);

    if (xray_) {
        xray_->log_round_result(result, scores_);
    }
    return result;
}

void GameSession::end_round(std::optional<PlayerID> round_winner, const std::string& reason) {
    round_->is_over = true;
    round_->winner_id = round_winner;
    rounds_played_++;

    if (xray_) {
        xray_->log_round_end(round_->round_number, round_winner, reason);
        xray_->log_state(*this);
    }
    check_game_end();
}

void GameSession::check_game_end() {
    if (!should_game_end(players_, scores_, rounds_played_, config_.variant,
                         config_.number_of_deals, config_.pool_limit)) {
        return;
    }

    phase_ = GamePhase::ENDED;
    winner_ = determine_game_winner(players_, scores_, config_.variant, config_.pool_limit);

    if (xray_) {
        std::string reason = config_.variant == Variant::DEALS
            ? "All " + std::to_string(config_.number_of_deals) + " deals played"
            : "One player left in the pool";
        xray_->log_game_end(winner_, reason);
    }
}

void GameSession::log_action(const PlayerID& player_id, const std::string& description) {
    if (!xray_) return;
    xray_->log_action(round_->turn_count, player_id, description);
    xray_->log_state(*this);
}

} // namespace rummy
