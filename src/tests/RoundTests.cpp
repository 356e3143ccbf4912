#include <gtest/gtest.h>

#include <memory>
#include <utility>

#include "../core/Exception.hpp"
#include "../core/HouseRules.hpp"
#include "../core/Round.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace blackjack::core;
using blackjack::test::CountingObserver;
using blackjack::test::ScriptedPlayer;
using blackjack::test::StackedShuffler;

namespace
{
    struct Table
    {
        CountingObserver obs;
        ScriptedPlayer* player{};
        std::unique_ptr<RoundImpl> round;
    };

    // Deal order: dealer, player, dealer, player, then every further draw.
    auto MakeTable(std::initializer_list<Rank> deal_order,
                   std::initializer_list<PlayerAction> decisions) -> std::unique_ptr<Table>
    {
        auto t = std::make_unique<Table>();
        auto p = std::make_unique<ScriptedPlayer>(decisions);
        t->player = p.get();
        t->round = std::make_unique<RoundImpl>(std::make_unique<HouseRules>(), std::move(p),
                                               t->obs, std::make_unique<StackedShuffler>(deal_order));
        return t;
    }
}

TEST(Round, SetupDealsTwoEachAlternating)
{
    auto t = MakeTable({Rank::Two, Rank::Three, Rank::Four, Rank::Five}, {StandAction{}});
    RoundImpl& r = *t->round;
    EXPECT_EQ(r.PhaseNow(), Phase::Setup);

    EXPECT_EQ(r.Step(), MoveOutcome::Applied);
    EXPECT_EQ(r.PhaseNow(), Phase::PlayerTurn);
    ASSERT_EQ(r.DealerHand().Size(), 2u);
    ASSERT_EQ(r.PlayerHand().Size(), 2u);
    EXPECT_EQ(r.DealerHand().Cards()[0]->rank, Rank::Two);
    EXPECT_EQ(r.PlayerHand().Cards()[0]->rank, Rank::Three);
    EXPECT_EQ(r.DealerHand().Cards()[1]->rank, Rank::Four);
    EXPECT_EQ(r.PlayerHand().Cards()[1]->rank, Rank::Five);
    EXPECT_EQ(r.DeckRemaining(), 48u);
    EXPECT_EQ(t->obs.dealer_deals, 2);
    EXPECT_EQ(t->obs.player_deals, 2);
    EXPECT_EQ(t->player->Asked(), 0u);
    blackjack::core::debug::CheckInvariants(r);
}

TEST(Round, BlackjackBeatsDealerNineteen)
{
    auto t = MakeTable({Rank::Ten, Rank::Ace, Rank::Nine, Rank::King}, {StandAction{}});
    EXPECT_EQ(t->round->PlayRound(), Outcome::PlayerWin);
    EXPECT_EQ(t->round->PlayerHand().Total(), 21);
    EXPECT_EQ(t->round->DealerHand().Total(), 19);
    EXPECT_EQ(t->round->DealerHand().Size(), 2u);
    blackjack::core::debug::CheckInvariants(*t->round);
}

TEST(Round, PlayerBustEndsRoundBeforeDealerPlays)
{
    // dealer 7+8 would have to draw, but never gets the chance
    auto t = MakeTable({Rank::Seven, Rank::Ten, Rank::Eight, Rank::Nine, Rank::Five}, {HitAction{}});
    RoundImpl& r = *t->round;
    ASSERT_EQ(r.Step(), MoveOutcome::Applied);
    EXPECT_EQ(r.Step(), MoveOutcome::RoundEnded);

    EXPECT_EQ(r.PhaseNow(), Phase::Resolved);
    ASSERT_TRUE(r.Result().has_value());
    EXPECT_EQ(*r.Result(), Outcome::PlayerBust);
    EXPECT_EQ(r.PlayerHand().Total(), 24);
    EXPECT_EQ(r.DealerHand().Size(), 2u);
    EXPECT_EQ(t->obs.dealer_hits, 0);
    EXPECT_EQ(t->obs.player_hits, 1);
    EXPECT_EQ(t->obs.resolved, 1);
    blackjack::core::debug::CheckInvariants(r);
}

TEST(Round, DealerDrawsToTwentyOne)
{
    auto t = MakeTable({Rank::Six, Rank::Ten, Rank::Five, Rank::Seven, Rank::Ten}, {StandAction{}});
    EXPECT_EQ(t->round->PlayRound(), Outcome::DealerWin);
    EXPECT_EQ(t->round->PlayerHand().Total(), 17);
    EXPECT_EQ(t->round->DealerHand().Total(), 21);
    EXPECT_EQ(t->round->DealerHand().Size(), 3u);
    EXPECT_EQ(t->obs.dealer_hits, 1);
    blackjack::core::debug::CheckInvariants(*t->round);
}

TEST(Round, TwoAcesAndNineIsTwentyOne)
{
    auto t = MakeTable({Rank::Ten, Rank::Ace, Rank::Eight, Rank::Ace, Rank::Nine},
                       {HitAction{}, StandAction{}});
    EXPECT_EQ(t->round->PlayRound(), Outcome::PlayerWin);
    EXPECT_EQ(t->round->PlayerHand().Size(), 3u);
    EXPECT_EQ(t->round->PlayerHand().Total(), 21);
    EXPECT_EQ(t->player->Asked(), 2u);
}

TEST(Round, EqualTotalsTie)
{
    auto t = MakeTable({Rank::Ten, Rank::King, Rank::Nine, Rank::Nine}, {StandAction{}});
    EXPECT_EQ(t->round->PlayRound(), Outcome::Tie);
    EXPECT_EQ(t->round->PlayerHand().Total(), 19);
    EXPECT_EQ(t->round->DealerHand().Total(), 19);
}

TEST(Round, DealerBustsOverTwentyOne)
{
    auto t = MakeTable({Rank::Ten, Rank::Ten, Rank::Six, Rank::Two, Rank::Queen}, {StandAction{}});
    EXPECT_EQ(t->round->PlayRound(), Outcome::DealerBust);
    EXPECT_EQ(t->round->DealerHand().Total(), 26);
    EXPECT_EQ(t->round->DealerHand().Size(), 3u);
    blackjack::core::debug::CheckInvariants(*t->round);
}

TEST(Round, DealerStandsOnSoftSeventeen)
{
    auto t = MakeTable({Rank::Ace, Rank::Ten, Rank::Six, Rank::Eight}, {StandAction{}});
    EXPECT_EQ(t->round->PlayRound(), Outcome::PlayerWin);
    EXPECT_EQ(t->round->DealerHand().Size(), 2u);
    EXPECT_EQ(t->round->DealerHand().Total(), 17);
    EXPECT_EQ(t->obs.dealer_hits, 0);
}

TEST(Round, DealerKeepsDrawingBelowSeventeen)
{
    // 2+3, then 4, 2, 5 -> 16 still draws, then 10 -> 26
    auto t = MakeTable({Rank::Two, Rank::Ten, Rank::Three, Rank::Eight,
                        Rank::Four, Rank::Two, Rank::Five, Rank::Ten},
                       {StandAction{}});
    EXPECT_EQ(t->round->PlayRound(), Outcome::DealerBust);
    EXPECT_EQ(t->round->DealerHand().Size(), 6u);
    EXPECT_EQ(t->obs.dealer_hits, 4);
}

TEST(Round, UnrecognisedInputIsRetriedWithoutSideEffects)
{
    auto t = MakeTable({Rank::Ten, Rank::Ten, Rank::Nine, Rank::Eight},
                       {UnrecognisedAction{"x"}, UnrecognisedAction{""}, StandAction{}});
    RoundImpl& r = *t->round;
    ASSERT_EQ(r.Step(), MoveOutcome::Applied);

    EXPECT_EQ(r.Step(), MoveOutcome::Invalid);
    EXPECT_EQ(r.PhaseNow(), Phase::PlayerTurn);
    EXPECT_EQ(r.PlayerHand().Size(), 2u);
    EXPECT_EQ(r.DeckRemaining(), 48u);
    ASSERT_EQ(t->obs.invalid.size(), 1u);
    error::RuleViolation const& why = t->obs.invalid.front();
    EXPECT_EQ(why.code, error::RuleViolationCode::Input_Unrecognised);
    ASSERT_TRUE(why.input.has_value());
    EXPECT_EQ(*why.input, "x");
    EXPECT_EQ(error::message(why), "Invalid choice, please enter 'h' or 's'.");
    EXPECT_EQ(error::describe(why), "Invalid choice, please enter 'h' or 's'. | input=\"x\"");

    EXPECT_EQ(r.Step(), MoveOutcome::Invalid);
    EXPECT_EQ(r.Step(), MoveOutcome::Applied);
    EXPECT_EQ(r.PhaseNow(), Phase::DealerTurn);
    EXPECT_EQ(r.Step(), MoveOutcome::RoundEnded);
    EXPECT_EQ(*r.Result(), Outcome::DealerWin);
    EXPECT_EQ(t->obs.turns, 3);
    EXPECT_EQ(t->player->Asked(), 3u);
}

TEST(Round, ValidateRejectsDecisionOutsidePlayerTurn)
{
    auto t = MakeTable({Rank::Ten, Rank::Ten, Rank::Nine, Rank::Eight}, {StandAction{}});
    HouseRules const rules;
    auto const res = rules.Validate(*t->round, HitAction{});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error::RuleViolationCode::WrongPhase_PlayerTurnRequired);
}

TEST(Round, HitOnABustHandIsFatal)
{
    // [10,9] then 5: bust, but the round is held in the player's turn
    auto p = std::make_unique<ScriptedPlayer>(std::initializer_list<PlayerAction>{HitAction{}, HitAction{}});
    CountingObserver obs;
    RoundImpl r(std::make_unique<blackjack::test::NoBustCheckRules>(), std::move(p), obs,
                std::make_unique<StackedShuffler>(std::initializer_list<Rank>{
                    Rank::Ten, Rank::Ten, Rank::Seven, Rank::Nine, Rank::Five}));
    ASSERT_EQ(r.Step(), MoveOutcome::Applied);
    ASSERT_EQ(r.Step(), MoveOutcome::Applied);
    ASSERT_TRUE(r.PlayerHand().IsBust());
    ASSERT_EQ(r.PhaseNow(), Phase::PlayerTurn);

    EXPECT_THROW((void)r.Step(), error::AssertionError);
    EXPECT_TRUE(obs.invalid.empty());
}

TEST(Round, SnapshotShowsOnlyDealerUpCard)
{
    auto t = MakeTable({Rank::Queen, Rank::Five, Rank::Three, Rank::Six}, {HitAction{}, StandAction{}});
    (void)t->round->PlayRound();

    auto const& snaps = t->player->Snapshots();
    ASSERT_GE(snaps.size(), 1u);
    auto const& first = *snaps.front();
    EXPECT_EQ(first.phase, Phase::PlayerTurn);
    EXPECT_EQ(first.my_total, 11);
    EXPECT_EQ(first.my_hand.size(), 2u);
    EXPECT_EQ(first.dealer_count, 2u);
    EXPECT_EQ(first.deck_remaining, 48u);
    auto const up = first.dealer_up.lock();
    ASSERT_TRUE(up);
    EXPECT_EQ(up->rank, Rank::Queen);
}

TEST(Round, StepAfterResolutionIsAnError)
{
    auto t = MakeTable({Rank::Ten, Rank::Ten, Rank::Nine, Rank::Eight}, {StandAction{}});
    (void)t->round->PlayRound();
    EXPECT_THROW((void)t->round->Step(), error::StateError);
}

TEST(Round, EachRoundStartsFromAFreshDeck)
{
    CountingObserver obs;
    auto p = std::make_unique<ScriptedPlayer>(std::initializer_list<PlayerAction>{});
    RoundImpl r(Config{.seed = 99}, std::make_unique<HouseRules>(), std::move(p), obs);

    for (int i{}; i < 20; ++i)
    {
        (void)r.PlayRound();
        EXPECT_EQ(r.DeckRemaining() + r.PlayerHand().Size() + r.DealerHand().Size(), constants::DeckSize);
        blackjack::core::debug::CheckInvariants(r);
    }
    EXPECT_EQ(obs.resolved, 20);

    r.Reset();
    EXPECT_EQ(r.PhaseNow(), Phase::Setup);
    EXPECT_FALSE(r.Result().has_value());
    EXPECT_TRUE(r.PlayerHand().Empty());
    EXPECT_EQ(r.DeckRemaining(), constants::DeckSize);
}

TEST(Rules, DealerPolicyThreshold)
{
    HouseRules const rules;
    for (int total{2}; total < 17; ++total) EXPECT_TRUE(rules.DealerDraws(total)) << total;
    for (int total{17}; total <= 30; ++total) EXPECT_FALSE(rules.DealerDraws(total)) << total;
}

TEST(Rules, SettleOrder)
{
    HouseRules const rules;
    EXPECT_EQ(rules.Settle(22, 25), Outcome::PlayerBust);
    EXPECT_EQ(rules.Settle(20, 22), Outcome::DealerBust);
    EXPECT_EQ(rules.Settle(20, 19), Outcome::PlayerWin);
    EXPECT_EQ(rules.Settle(18, 19), Outcome::DealerWin);
    EXPECT_EQ(rules.Settle(19, 19), Outcome::Tie);
}
