//
// Rules.hpp
//

#ifndef BLACKJACK_RULES_HPP
#define BLACKJACK_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace blackjack::core
{
    //forward declaration
    class RoundImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(RoundImpl const& round, PlayerAction const& a) const -> CheckResult = 0;

        // Mutate authoritative state (deal into the player's hand, change phase).
        virtual auto Apply(RoundImpl& round, PlayerAction const& a) -> void = 0;

        // Evaluates bust and moves the round on after an applied action.
        virtual auto Advance(RoundImpl& round) -> MoveOutcome = 0;

        // Fixed dealer policy: true while the dealer must take another card.
        virtual auto DealerDraws(int dealer_total) const -> bool = 0;

        // Final result from the two totals.
        virtual auto Settle(int player_total, int dealer_total) const -> Outcome = 0;
    };
}

#endif //BLACKJACK_RULES_HPP
