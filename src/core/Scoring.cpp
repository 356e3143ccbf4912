//
// Scoring.cpp
//
#include "Scoring.hpp"

#include "Exception.hpp"

namespace blackjack::core
{
    auto HandTotal(std::span<CCardSP const> cards) -> int
    {
        int total{};
        int soft_aces{};
        for (CCardSP const& c : cards)
        {
            BJK_ASSERT(c, "Null card in scored hand");
            total += BaseValue(c->rank);
            if (c->rank == Rank::Ace) ++soft_aces;
        }

        while (IsBust(total) && soft_aces > 0)
        {
            total -= 10;
            --soft_aces;
        }
        return total;
    }
}
