//
// ConsoleObserver.hpp
//

#ifndef BLACKJACK_CONSOLEOBSERVER_HPP
#define BLACKJACK_CONSOLEOBSERVER_HPP

#include <ostream>
#include <string_view>

#include "../core/Observer.hpp"
#include "CardView.hpp"

namespace blackjack::view
{
    // Human-facing round output. Borrows the view and the stream.
    class ConsoleObserver final : public core::RoundObserver
    {
    public:
        ConsoleObserver(CardView const& view, std::ostream& out);

        auto OnDealt(core::Party who, core::Hand const& hand) -> void override;
        auto OnPlayerTurn(core::Hand const& hand) -> void override;
        auto OnInvalidAction(core::error::RuleViolation const& why) -> void override;
        auto OnPlayerHit(core::Hand const& hand) -> void override;
        auto OnDealerHit(core::Hand const& hand) -> void override;
        auto OnResolved(core::Outcome outcome, core::Hand const& player, core::Hand const& dealer) -> void override;

    private:
        auto PrintHand(std::string_view who, core::Hand const& hand) -> void;

        CardView const& view_;
        std::ostream& out_;
    };
}

#endif //BLACKJACK_CONSOLEOBSERVER_HPP
