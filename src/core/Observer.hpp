//
// Observer.hpp
//

#ifndef BLACKJACK_OBSERVER_HPP
#define BLACKJACK_OBSERVER_HPP

#include <vector>
#include "Actions.hpp"
#include "Exception.hpp"
#include "Hand.hpp"
#include "Types.hpp"

namespace blackjack::core
{
    // Presentation sink. The round reports every intermediate hand state here;
    // what gets displayed is up to the implementation.
    class RoundObserver
    {
    public:
        virtual ~RoundObserver() = default;

        // After each card of the initial deal.
        virtual auto OnDealt(Party who, Hand const& hand) -> void = 0;
        // Before each player decision request.
        virtual auto OnPlayerTurn(Hand const& hand) -> void = 0;
        // A decision was refused; nothing changed and the player is asked again.
        virtual auto OnInvalidAction(error::RuleViolation const& why) -> void = 0;
        // After the player draws on Hit.
        virtual auto OnPlayerHit(Hand const& hand) -> void = 0;
        virtual auto OnDealerHit(Hand const& hand) -> void = 0;
        virtual auto OnResolved(Outcome outcome, Hand const& player, Hand const& dealer) -> void = 0;
    };

    // Forwards every event to each sink in order. Sinks are borrowed.
    class FanoutObserver final : public RoundObserver
    {
    public:
        FanoutObserver() = default;

        auto Add(RoundObserver& sink) -> void { sinks_.push_back(&sink); }

        auto OnDealt(Party who, Hand const& hand) -> void override
        {
            for (auto* s : sinks_) s->OnDealt(who, hand);
        }
        auto OnPlayerTurn(Hand const& hand) -> void override
        {
            for (auto* s : sinks_) s->OnPlayerTurn(hand);
        }
        auto OnInvalidAction(error::RuleViolation const& why) -> void override
        {
            for (auto* s : sinks_) s->OnInvalidAction(why);
        }
        auto OnPlayerHit(Hand const& hand) -> void override
        {
            for (auto* s : sinks_) s->OnPlayerHit(hand);
        }
        auto OnDealerHit(Hand const& hand) -> void override
        {
            for (auto* s : sinks_) s->OnDealerHit(hand);
        }
        auto OnResolved(Outcome outcome, Hand const& player, Hand const& dealer) -> void override
        {
            for (auto* s : sinks_) s->OnResolved(outcome, player, dealer);
        }

    private:
        std::vector<RoundObserver*> sinks_;
    };
}

#endif //BLACKJACK_OBSERVER_HPP
