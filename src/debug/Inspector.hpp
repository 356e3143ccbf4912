//
// Inspector.hpp
//

#ifndef BLACKJACK_INSPECTOR_HPP
#define BLACKJACK_INSPECTOR_HPP

#include <vector>
#include <optional>
#include <span>

#include "../core/Types.hpp"
#include "../core/Round.hpp"

namespace blackjack::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<CCardSP> deck;
            std::vector<CCardSP> player;
            std::vector<CCardSP> dealer;
            Phase phase{};
            std::optional<Outcome> outcome{};
        };

        static inline auto Gather(RoundImpl const& r) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.phase = r.phase_;
            ret.outcome = r.outcome_;

            auto copy = [](std::span<CCardSP const> src, std::vector<CCardSP>& dst)
            {
                dst.assign(src.begin(), src.end());
            };
            copy(r.deck_.Cards(), ret.deck);
            copy(r.player_hand_.Cards(), ret.player);
            copy(r.dealer_hand_.Cards(), ret.dealer);

            return ret;
        }

        static inline auto RulesOf(RoundImpl const& r) -> core::Rules const&
        {
            return *r.rules_;
        }
    };
}

#endif //BLACKJACK_INSPECTOR_HPP
