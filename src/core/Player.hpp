//
// Player.hpp
//

#ifndef BLACKJACK_PLAYER_HPP
#define BLACKJACK_PLAYER_HPP

#include "Actions.hpp"
#include "State.hpp"

namespace blackjack::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the round once per player decision. Blocks until a decision is available.
        // Anything other than Hit/Stand is rejected by the rules and asked again.
        virtual PlayerAction Play(std::shared_ptr<const RoundSnapshot> snapshot) = 0;
    };
}
#endif //BLACKJACK_PLAYER_HPP
