//
// Deck.cpp
//
#include "Deck.hpp"

#include <algorithm>
#include <utility>
#include "Exception.hpp"
#include "Util.hpp"

namespace blackjack::core
{
    RandomShuffler::RandomShuffler(uint64_t seed) :
        rng_{seed} {}

    auto RandomShuffler::Shuffle(std::vector<CCardSP>& cards) -> void
    {
        std::ranges::shuffle(cards, rng_);
    }

    auto RandomShuffler::Reseed(uint64_t seed) -> void
    {
        rng_.seed(seed);
    }

    Deck::Deck()
    {
        cards_.reserve(constants::DeckSize);
        constexpr size_t rank_start = std::to_underlying(Rank::Ace);
        constexpr size_t rank_end = std::to_underlying(Rank::King) + 1;
        for (Suit const s : AllSuits)
        {
            for (size_t r{rank_start}; r < rank_end; ++r)
            {
                cards_.emplace_back(MakeCard(s, static_cast<Rank>(r)));
            }
        }
    }

    auto Deck::Shuffle(Shuffler& shuffler) -> void
    {
        size_t const before = cards_.size();
        shuffler.Shuffle(cards_);
        BJK_ASSERT(cards_.size() == before, "Shuffler changed the number of cards in the deck");

        util::CardUniqueChecker checker{};
        for (CCardSP const& c : cards_)
        {
            BJK_ASSERT(c, "Shuffler produced a null card");
            checker.Add(*c);
        }
        BJK_ASSERT(!checker.ContainsDup(), "Shuffler duplicated a card");
    }

    auto Deck::Deal() -> CCardSP
    {
        BJK_ASSERT(!cards_.empty(), "Dealt from an empty deck");
        CCardSP top = std::move(cards_.back());
        cards_.pop_back();
        return top;
    }
}
