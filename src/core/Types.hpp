//
// Types.hpp
//

#ifndef BLACKJACK_TYPES_HPP
#define BLACKJACK_TYPES_HPP

#define BJK_ENABLE_TEST_HOOKS true

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <random>
namespace blackjack::core::constants
{
    inline constexpr size_t DeckSize = 52;
    inline constexpr size_t InitialHandSize = 2;
    inline constexpr int BlackjackLimit = 21;
    inline constexpr int DealerStandsOn = 17;
}
namespace blackjack::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Spades,
        Clubs
    };
    enum class Rank : uint8_t
    {
        Ace = 1,
        Two,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King
    };
    inline constexpr std::array<Suit, 4> AllSuits{Suit::Hearts, Suit::Diamonds, Suit::Spades, Suit::Clubs};

    struct Card
    {
        Card() = delete;
        Card(Suit suit, Rank rank) : suit(suit), rank(rank) {}

        Suit const suit;
        Rank const rank;
        ///////////////////////////////////
        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;
    };
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }
    using CCardSP = std::shared_ptr<Card const>;
    using CCardWP = std::weak_ptr<Card const>;

    inline auto MakeCard(Suit suit, Rank rank) -> CCardSP
    {
        return std::make_shared<Card const>(suit, rank);
    }

    enum class Party : uint8_t
    {
        Player,
        Dealer
    };

    struct Config
    {
        uint64_t seed{std::random_device{}()};
    };
}

#endif //BLACKJACK_TYPES_HPP
