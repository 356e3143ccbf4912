//
// RandomAi.cpp
//

#include "RandomAi.hpp"
#include <random>
#include <span>
#include <utility>

#include "Exception.hpp"
#include "Util.hpp"

namespace blackjack::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomAI::Play(std::shared_ptr<const RoundSnapshot> snapshot) -> PlayerAction
    {
        BJK_ASSERT(snapshot, "Null snapshot handed to player");
        BJK_ASSERT(!util::any_invalid(std::span{snapshot->my_hand}), "No cards in hand should be invalid");

        if (std::bernoulli_distribution{0.5}(rng_))
        {
            return HitAction{};
        }
        return StandAction{};
    }

    ThresholdAI::ThresholdAI(int stand_on):
        stand_on_(stand_on)
    {
        BJK_ASSERT(stand_on_ > 0 && stand_on_ <= constants::BlackjackLimit + 1, "Stand threshold out of range");
    }

    auto ThresholdAI::Play(std::shared_ptr<const RoundSnapshot> snapshot) -> PlayerAction
    {
        BJK_ASSERT(snapshot, "Null snapshot handed to player");
        if (snapshot->my_total < stand_on_)
        {
            return HitAction{};
        }
        return StandAction{};
    }
}
