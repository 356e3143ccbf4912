//
// RandomAi.hpp
//

#ifndef BLACKJACK_RANDOMAI_HPP
#define BLACKJACK_RANDOMAI_HPP

#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace blackjack::core
{
    // Hits or stands with equal probability.
    class RandomAI final : public blackjack::core::Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto Play(std::shared_ptr<const blackjack::core::RoundSnapshot> snapshot) -> blackjack::core::PlayerAction override;

    private:
        std::mt19937 rng_;
    };

    // Mirrors the dealer: hits below stand_on, stands otherwise.
    class ThresholdAI final : public blackjack::core::Player
    {
    public:
        explicit ThresholdAI(int stand_on = constants::DealerStandsOn);

        auto Play(std::shared_ptr<const blackjack::core::RoundSnapshot> snapshot) -> blackjack::core::PlayerAction override;

        auto StandOn() const noexcept -> int { return stand_on_; }

    private:
        int stand_on_;
    };
}

#endif //BLACKJACK_RANDOMAI_HPP
