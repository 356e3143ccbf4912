#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <vector>

#include "../core/Hand.hpp"
#include "../core/Scoring.hpp"

using namespace blackjack::core;

namespace
{
    auto MakeHand(std::initializer_list<Rank> ranks) -> std::vector<CCardSP>
    {
        std::vector<CCardSP> out;
        size_t i{};
        for (Rank const r : ranks)
        {
            out.push_back(MakeCard(AllSuits[i++ % AllSuits.size()], r));
        }
        return out;
    }

    // Reference: try every soft/hard assignment of the aces.
    auto BestTotal(std::vector<CCardSP> const& cards) -> int
    {
        int hard{};
        int aces{};
        for (auto const& c : cards)
        {
            if (c->rank == Rank::Ace) { ++aces; hard += 1; }
            else hard += BaseValue(c->rank);
        }
        int best = hard;
        for (int soft{1}; soft <= aces; ++soft)
        {
            int const t = hard + 10 * soft;
            if (t <= 21) best = t;
        }
        return best;
    }
}

TEST(Scoring, BaseValues)
{
    EXPECT_EQ(BaseValue(Rank::Ace), 11);
    EXPECT_EQ(BaseValue(Rank::Two), 2);
    EXPECT_EQ(BaseValue(Rank::Nine), 9);
    EXPECT_EQ(BaseValue(Rank::Ten), 10);
    EXPECT_EQ(BaseValue(Rank::Jack), 10);
    EXPECT_EQ(BaseValue(Rank::Queen), 10);
    EXPECT_EQ(BaseValue(Rank::King), 10);
}

TEST(Scoring, EmptyHandIsZero)
{
    std::vector<CCardSP> const none;
    EXPECT_EQ(HandTotal(none), 0);
    EXPECT_EQ(Hand{}.Total(), 0);
}

TEST(Scoring, NoAcesIsPlainSum)
{
    EXPECT_EQ(HandTotal(MakeHand({Rank::Two, Rank::Three})), 5);
    EXPECT_EQ(HandTotal(MakeHand({Rank::Jack, Rank::Queen})), 20);
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ten, Rank::Seven})), 17);
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ten, Rank::Nine, Rank::Five})), 24);
}

TEST(Scoring, AceSoftAndHard)
{
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ace, Rank::King})), 21);
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ace, Rank::Six})), 17);
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ace, Rank::Six, Rank::Nine})), 16);
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ace, Rank::Ace})), 12);
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ace, Rank::Ace, Rank::Nine})), 21);
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ace, Rank::Ace, Rank::Ace, Rank::Ace, Rank::King})), 14);
}

TEST(Scoring, BustIsNotClamped)
{
    auto const h = MakeHand({Rank::King, Rank::Queen, Rank::Five});
    EXPECT_EQ(HandTotal(h), 25);
    EXPECT_TRUE(IsBust(HandTotal(h)));
    // every ace already hard
    EXPECT_EQ(HandTotal(MakeHand({Rank::Ace, Rank::King, Rank::Queen, Rank::Five})), 26);
}

TEST(Scoring, MatchesBestAceAssignment)
{
    std::mt19937 rng{20240917u};
    std::uniform_int_distribution<int> rank_dist{1, 13};
    std::uniform_int_distribution<int> len_dist{1, 8};

    for (int iter{}; iter < 2000; ++iter)
    {
        std::vector<CCardSP> cards;
        int const n = len_dist(rng);
        for (int i{}; i < n; ++i)
        {
            cards.push_back(MakeCard(Suit::Spades, static_cast<Rank>(rank_dist(rng))));
        }
        ASSERT_EQ(HandTotal(cards), BestTotal(cards));
    }
}

TEST(Scoring, OrderIndependent)
{
    auto cards = MakeHand({Rank::Ace, Rank::Five, Rank::Ace, Rank::King, Rank::Two});
    int const expected = HandTotal(cards);
    EXPECT_EQ(expected, 19);

    std::ranges::sort(cards, {}, [](CCardSP const& c) { return c->rank; });
    do
    {
        ASSERT_EQ(HandTotal(cards), expected);
    } while (std::ranges::next_permutation(cards, {}, [](CCardSP const& c) { return c->rank; }).found);
}

TEST(Hand, AddGrowsAndTotalsOnDemand)
{
    Hand h;
    EXPECT_TRUE(h.Empty());
    h.Add(MakeCard(Suit::Hearts, Rank::Ace));
    EXPECT_EQ(h.Total(), 11);
    h.Add(MakeCard(Suit::Clubs, Rank::Ace));
    EXPECT_EQ(h.Total(), 12);
    h.Add(MakeCard(Suit::Spades, Rank::Nine));
    EXPECT_EQ(h.Total(), 21);
    EXPECT_EQ(h.Size(), 3u);
    EXPECT_FALSE(h.IsBust());
    h.Add(MakeCard(Suit::Spades, Rank::Five));
    EXPECT_EQ(h.Total(), 16);
    EXPECT_EQ(h.Cards().front()->rank, Rank::Ace);
}
