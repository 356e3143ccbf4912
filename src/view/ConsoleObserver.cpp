//
// ConsoleObserver.cpp
//
#include "ConsoleObserver.hpp"

namespace blackjack::view
{
    ConsoleObserver::ConsoleObserver(CardView const& view, std::ostream& out) :
        view_(view), out_(out) {}

    auto ConsoleObserver::PrintHand(std::string_view const who, core::Hand const& hand) -> void
    {
        out_ << who << "'s hand total: " << hand.Total() << '\n'
             << "Hand: " << RenderHand(view_, hand) << '\n';
    }

    auto ConsoleObserver::OnDealt(core::Party const who, core::Hand const& hand) -> void
    {
        // only the dealer's first card is face up
        if (who == core::Party::Dealer && hand.Size() == 1)
        {
            out_ << "\nDealer shows: " << view_.Draw(*hand.Cards().front()) << '\n';
        }
    }

    auto ConsoleObserver::OnPlayerTurn(core::Hand const& hand) -> void
    {
        PrintHand("Player", hand);
    }

    auto ConsoleObserver::OnInvalidAction(core::error::RuleViolation const& why) -> void
    {
        out_ << core::error::message(why) << '\n';
    }

    auto ConsoleObserver::OnPlayerHit(core::Hand const& hand) -> void
    {
        out_ << "Player draws: " << view_.Draw(*hand.Cards().back()) << '\n';
    }

    auto ConsoleObserver::OnDealerHit(core::Hand const& hand) -> void
    {
        out_ << "Dealer draws: " << view_.Draw(*hand.Cards().back()) << '\n';
    }

    auto ConsoleObserver::OnResolved(core::Outcome const outcome,
                                     core::Hand const& player,
                                     core::Hand const& dealer) -> void
    {
        out_ << '\n';
        PrintHand("Dealer", dealer);
        PrintHand("Player", player);
        out_ << core::to_string(outcome) << std::endl;
    }
}
