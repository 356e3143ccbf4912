//
// State.hpp
//

#ifndef BLACKJACK_STATE_HPP
#define BLACKJACK_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"



namespace blackjack::core
{
    // Immutable snapshot exposed to decision sources (non-owning)
    struct RoundSnapshot
    {
        Phase phase{Phase::Setup};

        // player sees own hand, dealer's face-up card and counts
        std::vector<CCardWP> my_hand;
        int my_total{};

        CCardWP dealer_up;
        uint8_t dealer_count{};
        uint8_t deck_remaining{};
    };

} // namespace blackjack::core

#endif //BLACKJACK_STATE_HPP
