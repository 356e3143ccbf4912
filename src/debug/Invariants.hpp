//
// Invariants.hpp
//

#ifndef BLACKJACK_INVARIANTS_HPP
#define BLACKJACK_INVARIANTS_HPP

#include "../core/Round.hpp"
#include "../core/Exception.hpp"
#include "../core/Scoring.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <span>
#include <unordered_set>
#include <vector>

namespace blackjack::core::debug
{
    // A second layer of checks over the authoritative round state. Throws AssertionError.
    inline auto CheckInvariants(RoundImpl const& r) -> void
    {
#if BJK_ENABLE_TEST_HOOKS == false
        (void)r;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(r);

    // total of the first n cards
    auto total_of = [](std::vector<CCardSP> const& cards, size_t n) -> int
    {
        return HandTotal(std::span{cards}.first(n));
    };

    // 1) Every card is in exactly one zone and nothing is lost
    {
        std::unordered_set<Card const*> seen;
        seen.reserve(constants::DeckSize);
        util::CardUniqueChecker faces{};

        auto push_unique = [&](CCardSP const& p)
        {
            BJK_ASSERT(p != nullptr, "Null card in a zone");
            bool const inserted = seen.insert(p.get()).second;
            BJK_ASSERT(inserted, "Duplicate card pointer across zones");
            faces.Add(*p);
        };

        for (auto const& p : s.deck)   push_unique(p);
        for (auto const& p : s.player) push_unique(p);
        for (auto const& p : s.dealer) push_unique(p);

        BJK_ASSERT(seen.size() == constants::DeckSize, "Materialized card count != deck size");
        BJK_ASSERT(!faces.ContainsDup(), "Duplicate rank/suit across zones");
    }

    // 2) Phase-specific shape
    switch (s.phase)
    {
    case Phase::Setup:
        BJK_ASSERT(s.player.empty() && s.dealer.empty(), "Cards dealt before setup completed");
        BJK_ASSERT(!s.outcome, "Outcome present before the round started");
        break;
    case Phase::PlayerTurn:
        BJK_ASSERT(s.player.size() >= constants::InitialHandSize, "Player turn with short hand");
        BJK_ASSERT(s.dealer.size() == constants::InitialHandSize, "Dealer drew during the player turn");
        BJK_ASSERT(!IsBust(total_of(s.player, s.player.size())), "Player turn continues after bust");
        BJK_ASSERT(!s.outcome, "Outcome present during the player turn");
        break;
    case Phase::DealerTurn:
    case Phase::Resolved:
        BJK_ASSERT(s.phase == Phase::DealerTurn || s.outcome.has_value(), "Resolved round without outcome");
        if (s.outcome == Outcome::PlayerBust)
        {
            BJK_ASSERT(s.dealer.size() == constants::InitialHandSize, "Dealer played after player bust");
            break;
        }
        BJK_ASSERT(!IsBust(total_of(s.player, s.player.size())), "Dealer turn after player bust");
        // 3) Dealer drew only while below the stand threshold
        for (size_t n{constants::InitialHandSize}; n < s.dealer.size(); ++n)
        {
            BJK_ASSERT(Inspector::RulesOf(r).DealerDraws(total_of(s.dealer, n)),
                       "Dealer drew at or above the stand threshold");
        }
        if (s.phase == Phase::Resolved)
        {
            BJK_ASSERT(!Inspector::RulesOf(r).DealerDraws(total_of(s.dealer, s.dealer.size())),
                       "Dealer stopped below the stand threshold");
        }
        break;
    }

    // 4) Outcome agrees with the final totals
    if (s.outcome)
    {
        BJK_ASSERT(*s.outcome == Inspector::RulesOf(r).Settle(total_of(s.player, s.player.size()),
                                                            total_of(s.dealer, s.dealer.size())),
                   "Outcome does not match final totals");
    }
#endif // BJK_ENABLE_TEST_HOOKS == true
    }
}
#endif //BLACKJACK_INVARIANTS_HPP
