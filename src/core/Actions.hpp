//
// Actions.hpp
//

#ifndef BLACKJACK_ACTIONS_HPP
#define BLACKJACK_ACTIONS_HPP

#include <string>
#include <string_view>
#include <variant>
#include "Types.hpp"

namespace blackjack::core
{
    struct HitAction   {};
    struct StandAction {};
    // Raw input a decision source could not map onto Hit or Stand.
    struct UnrecognisedAction { std::string text; };

    using PlayerAction = std::variant<HitAction, StandAction, UnrecognisedAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        RoundEnded
    };

    enum class Phase : uint8_t
    {
        Setup,
        PlayerTurn,
        DealerTurn,
        Resolved
    };

    enum class Outcome : uint8_t
    {
        PlayerBust,
        DealerBust,
        PlayerWin,
        DealerWin,
        Tie
    };

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Setup: return "Setup";
        case Phase::PlayerTurn: return "PlayerTurn";
        case Phase::DealerTurn: return "DealerTurn";
        case Phase::Resolved: return "Resolved";
        }
        return "Unknown";
    }

    inline auto to_string(Outcome o) -> std::string_view
    {
        switch (o)
        {
        case Outcome::PlayerBust: return "Player busts! Dealer wins.";
        case Outcome::DealerBust: return "Dealer busts! Player wins.";
        case Outcome::PlayerWin: return "Player wins!";
        case Outcome::DealerWin: return "Dealer wins!";
        case Outcome::Tie: return "It's a tie!";
        }
        return "Unknown";
    }

    inline auto to_string(MoveOutcome m) -> std::string_view
    {
        switch (m)
        {
        case MoveOutcome::Invalid: return "Invalid";
        case MoveOutcome::Applied: return "Applied";
        case MoveOutcome::RoundEnded: return "RoundEnded";
        }
        return "Unknown";
    }
} // namespace blackjack::core

#endif //BLACKJACK_ACTIONS_HPP
