//
// HouseRules.cpp
//

#include "HouseRules.hpp"

#include "Round.hpp"
#include "Scoring.hpp"
#include <type_traits>
#include <variant>
namespace
{
    inline auto Viol(blackjack::core::error::RuleViolationCode code) -> blackjack::core::error::RuleViolation
    {
        return blackjack::core::error::RuleViolation{ .code = code };
    }
}

namespace blackjack::core
{
auto HouseRules::Validate(RoundImpl const& round, PlayerAction const& a) const -> CheckResult
{
    using RVC = ::blackjack::core::error::RuleViolationCode;

    if (round.phase_ != Phase::PlayerTurn)
        return std::unexpected(Viol(RVC::WrongPhase_PlayerTurnRequired).with_phase(round.phase_));

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, UnrecognisedAction>)
        {
            return std::unexpected(Viol(RVC::Input_Unrecognised).with_input(act.text));
        }
        else if constexpr (std::is_same_v<T, HitAction>)
        {
            // a bust hand resolves in Advance, so a live turn is never already over 21
            BJK_ASSERT(!round.player_hand_.IsBust(), "Hit requested on a bust hand");
            return {};
        }
        else
        {
            return {};
        }
    }, a);
}

auto HouseRules::Apply(RoundImpl& round, PlayerAction const& a) -> void
{
    std::visit([&]<typename T0>(T0 const& act)
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, HitAction>)
        {
            round.DealTo(Party::Player);
            round.observer_.OnPlayerHit(round.player_hand_);
        }
        else if constexpr (std::is_same_v<T, StandAction>)
        {
            round.phase_ = Phase::DealerTurn;
        }
        else
        {
            BJK_THROW(error::Code::InvalidAction, "Apply called with unvalidated input: " + act.text);
        }
    }, a);
}

auto HouseRules::Advance(RoundImpl& round) -> MoveOutcome
{
    if (round.phase_ == Phase::PlayerTurn && round.player_hand_.IsBust())
    {
        round.Resolve();
        return MoveOutcome::RoundEnded;
    }
    return MoveOutcome::Applied;
}

auto HouseRules::DealerDraws(int const dealer_total) const -> bool
{
    return dealer_total < constants::DealerStandsOn;
}

auto HouseRules::Settle(int const player_total, int const dealer_total) const -> Outcome
{
    if (IsBust(player_total)) return Outcome::PlayerBust;
    if (IsBust(dealer_total)) return Outcome::DealerBust;
    if (player_total > dealer_total) return Outcome::PlayerWin;
    if (dealer_total > player_total) return Outcome::DealerWin;
    return Outcome::Tie;
}
}
