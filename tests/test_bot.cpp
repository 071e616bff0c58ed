/**
 * Tests for the Bot Decision Engine
 */

#include "test_helpers.hpp"

using namespace rummy;
using namespace test_helpers;

namespace {

// One pure run, two pairs, loose cards (65 deadwood)
std::vector<Card> draw_phase_hand() {
    return cards({"3S", "4S", "7H", "8H", "9H", "2C", "2D", "KC", "KD", "10S", "JH", "5D", "9C"});
}

// No run anywhere, 85 deadwood
std::vector<Card> hopeless_hand() {
    return cards({"AS", "4S", "7S", "10S", "KS", "2C", "6C", "9C", "QC", "3D", "8D", "JD", "5H"});
}

BotContext draw_context(std::vector<Card> hand, std::optional<Card> top) {
    BotContext context;
    context.hand = std::move(hand);
    context.top_discard = std::move(top);
    context.turn_phase = TurnPhase::DRAW;
    return context;
}

} // namespace

// ============================================================================
// PROFILES AND NAMES
// ============================================================================

TEST(Bot, ProfilesScaleWithDifficulty) {
    const BotProfile& easy = get_bot_profile(BotDifficulty::EASY);
    const BotProfile& medium = get_bot_profile(BotDifficulty::MEDIUM);
    const BotProfile& hard = get_bot_profile(BotDifficulty::HARD);

    TEST_ASSERT_TRUE(easy.thinking_time_ms > medium.thinking_time_ms);
    TEST_ASSERT_TRUE(medium.thinking_time_ms > hard.thinking_time_ms);
    TEST_ASSERT_FALSE(easy.drop_threshold.has_value());
    TEST_ASSERT_FALSE(easy.simulate_discards);
    TEST_ASSERT_TRUE(hard.read_discard_history);
    TEST_ASSERT_TRUE(*hard.drop_threshold < *medium.drop_threshold);
}

TEST(Bot, Names) {
    TEST_ASSERT_EQ(std::string("Rookie Ravi"), get_bot_name(BotDifficulty::EASY, 0));
    TEST_ASSERT_EQ(std::string("Shark Arjun"), get_bot_name(BotDifficulty::HARD, 1));
    TEST_ASSERT_EQ(std::string("Sharp Suresh"), get_bot_name(BotDifficulty::MEDIUM, 2));
    TEST_ASSERT_EQ(std::string("Rookie Ravi 2"), get_bot_name(BotDifficulty::EASY, 3));
}

// ============================================================================
// DRAW SOURCE
// ============================================================================

TEST(Bot, TakesDiscardThatCompletesRun) {
    auto context = draw_context(draw_phase_hand(), card("5S"));
    TEST_ASSERT_TRUE(choose_draw_source(BotDifficulty::MEDIUM, context) == DrawSource::DISCARD);
    TEST_ASSERT_TRUE(choose_draw_source(BotDifficulty::HARD, context) == DrawSource::DISCARD);
}

TEST(Bot, LeavesUselessDiscard) {
    auto context = draw_context(draw_phase_hand(), card("6C"));
    TEST_ASSERT_TRUE(choose_draw_source(BotDifficulty::MEDIUM, context) == DrawSource::DECK);

    // Low card that melds with nothing only looks cheap
    context.top_discard = card("AH");
    TEST_ASSERT_TRUE(choose_draw_source(BotDifficulty::MEDIUM, context) == DrawSource::DECK);
    TEST_ASSERT_TRUE(choose_draw_source(BotDifficulty::HARD, context) == DrawSource::DECK);
}

TEST(Bot, AlwaysTakesJoker) {
    auto context = draw_context(draw_phase_hand(), joker(1, 1));
    TEST_ASSERT_TRUE(choose_draw_source(BotDifficulty::EASY, context) == DrawSource::DISCARD);
}

TEST(Bot, EmptyOrMalformedDiscardMeansDeck) {
    auto context = draw_context(draw_phase_hand(), std::nullopt);
    TEST_ASSERT_TRUE(choose_draw_source(BotDifficulty::HARD, context) == DrawSource::DECK);

    context.top_discard = Card();
    TEST_ASSERT_TRUE(choose_draw_source(BotDifficulty::HARD, context) == DrawSource::DECK);
}

// ============================================================================
// DISCARD
// ============================================================================

TEST(Bot, EasyShedsHighestDeadwood) {
    auto hand = add_card_to_hand(draw_phase_hand(), card("5S"));
    auto choice = choose_discard(BotDifficulty::EASY, hand, {});
    TEST_ASSERT_TRUE(choice.has_value());
    TEST_ASSERT_EQ(std::string("d0-10S"), choice->card.id);
}

TEST(Bot, ForbiddenCardNeverShed) {
    auto hand = add_card_to_hand(draw_phase_hand(), card("QS"));

    auto open = choose_discard(BotDifficulty::MEDIUM, hand, {});
    TEST_ASSERT_EQ(std::string("d0-10S"), open->card.id);

    auto blocked = choose_discard(BotDifficulty::MEDIUM, hand, {}, std::string("d0-10S"));
    TEST_ASSERT_TRUE(blocked.has_value());
    TEST_ASSERT_NE(std::string("d0-10S"), blocked->card.id);
    TEST_ASSERT_EQ(65, blocked->remaining.deadwood_points);
}

TEST(Bot, HardReadsDiscardHistory) {
    auto hand = add_card_to_hand(draw_phase_hand(), card("QS"));
    std::vector<Card> history = {card("KH", 1), card("KS", 1)};

    auto medium = choose_discard(BotDifficulty::MEDIUM, hand, history);
    auto hard = choose_discard(BotDifficulty::HARD, hand, history);
    TEST_ASSERT_EQ(std::string("d0-10S"), medium->card.id);
    TEST_ASSERT_EQ(std::string("d0-KC"), hard->card.id);
}

TEST(Bot, KeepsJokers) {
    std::vector<Card> hand = concat(draw_phase_hand(), {joker(1)});
    auto choice = choose_discard(BotDifficulty::MEDIUM, hand, {});
    TEST_ASSERT_TRUE(choice.has_value());
    TEST_ASSERT_FALSE(choice->card.is_joker());
}

TEST(Bot, EmptyHandHasNoDiscard) {
    TEST_ASSERT_FALSE(choose_discard(BotDifficulty::HARD, {}, {}).has_value());
}

// ============================================================================
// DROP
// ============================================================================

TEST(Bot, DropsHopelessFirstHand) {
    BotContext context = draw_context(hopeless_hand(), card("6H"));
    context.is_first_turn = true;

    TEST_ASSERT_TRUE(should_drop(BotDifficulty::HARD, context));
    TEST_ASSERT_TRUE(should_drop(BotDifficulty::MEDIUM, context));
    TEST_ASSERT_FALSE(should_drop(BotDifficulty::EASY, context));

    BotDecision decision = get_bot_decision(BotDifficulty::HARD, context);
    TEST_ASSERT_TRUE(decision.action == BotActionType::DROP);
    TEST_ASSERT_FALSE(decision.card.has_value());
}

TEST(Bot, NoDropAfterFirstTurn) {
    BotContext context = draw_context(hopeless_hand(), card("6H"));
    context.is_first_turn = false;
    TEST_ASSERT_FALSE(should_drop(BotDifficulty::HARD, context));
}

TEST(Bot, NoDropWhenHandHasARun) {
    BotContext context = draw_context(draw_phase_hand(), card("6C"));
    context.is_first_turn = true;
    TEST_ASSERT_FALSE(should_drop(BotDifficulty::HARD, context));

    BotDecision decision = get_bot_decision(BotDifficulty::HARD, context);
    TEST_ASSERT_TRUE(decision.action == BotActionType::DRAW);
    TEST_ASSERT_TRUE(decision.source == DrawSource::DECK);
}

TEST(Bot, PoolDropThatWouldBustIsSkipped) {
    BotContext context = draw_context(hopeless_hand(), card("6H"));
    context.is_first_turn = true;
    context.pool_limit = 101;
    context.current_score = 90;
    TEST_ASSERT_FALSE(should_drop(BotDifficulty::HARD, context));

    context.current_score = 30;
    TEST_ASSERT_TRUE(should_drop(BotDifficulty::HARD, context));
}

// ============================================================================
// FULL DECISIONS
// ============================================================================

TEST(Bot, DeclaresWhenDiscardCompletesHand) {
    BotContext context;
    context.hand = concat(cards({"3S", "4S", "5S", "7H", "8H", "9H", "2C", "2D", "2S", "KC", "KD", "9C"}),
                          {joker(1), joker(2)});
    context.turn_phase = TurnPhase::DISCARD;

    BotDecision decision = get_bot_decision(BotDifficulty::MEDIUM, context);
    TEST_ASSERT_TRUE(decision.action == BotActionType::DECLARE);
    TEST_ASSERT_EQ(std::string("d0-9C"), decision.card->id);

    DeclarationResult verdict = validate_declaration(decision.melds);
    TEST_ASSERT_TRUE(verdict.is_valid);
}

TEST(Bot, DiscardPhaseOtherwiseDiscards) {
    BotContext context;
    context.hand = add_card_to_hand(draw_phase_hand(), card("6C"));
    context.turn_phase = TurnPhase::DISCARD;
    context.picked_up_id = std::string("d0-6C");

    BotDecision decision = get_bot_decision(BotDifficulty::HARD, context);
    TEST_ASSERT_TRUE(decision.action == BotActionType::DISCARD);
    TEST_ASSERT_TRUE(decision.card.has_value());
    TEST_ASSERT_NE(std::string("d0-6C"), decision.card->id);
    TEST_ASSERT_EQ(get_bot_profile(BotDifficulty::HARD).thinking_time_ms, decision.thinking_time_ms);
}
