//
// Scoring.hpp
//

#ifndef BLACKJACK_SCORING_HPP
#define BLACKJACK_SCORING_HPP

#include <span>
#include "Types.hpp"

namespace blackjack::core
{
    // Ace counts 11 (soft), court cards 10, the rest their pip value.
    constexpr auto BaseValue(Rank const r) noexcept -> int
    {
        if (r == Rank::Ace) return 11;
        if (r >= Rank::Jack) return 10;
        return static_cast<int>(r);
    }

    // Counts every ace soft, then hardens them one at a time while the total is over 21.
    // Depends only on the multiset of ranks. An empty span totals 0.
    auto HandTotal(std::span<CCardSP const> cards) -> int;

    constexpr auto IsBust(int const total) noexcept -> bool
    {
        return total > constants::BlackjackLimit;
    }
}

#endif //BLACKJACK_SCORING_HPP
