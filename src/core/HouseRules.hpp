//
// HouseRules.hpp
//

#ifndef BLACKJACK_HOUSERULES_HPP
#define BLACKJACK_HOUSERULES_HPP
#include "Rules.hpp"

namespace blackjack::core
{
    // Dealer stands on all 17s; no splits, doubles or insurance.
    class HouseRules final : public Rules
    {
    public:
        auto Validate(RoundImpl const& round, PlayerAction const& a) const -> CheckResult override;
        auto Apply(RoundImpl& round, PlayerAction const& a) -> void override;
        auto Advance(RoundImpl& round) -> MoveOutcome override;
        auto DealerDraws(int dealer_total) const -> bool override;
        auto Settle(int player_total, int dealer_total) const -> Outcome override;
    };
}

#endif //BLACKJACK_HOUSERULES_HPP
