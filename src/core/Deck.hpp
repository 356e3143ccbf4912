//
// Deck.hpp
//

#ifndef BLACKJACK_DECK_HPP
#define BLACKJACK_DECK_HPP

#include <random>
#include <span>
#include <vector>
#include "Types.hpp"

namespace blackjack::core
{
    // Source of the deck permutation. Production code uses RandomShuffler,
    // tests substitute their own to stack the deck.
    class Shuffler
    {
    public:
        virtual ~Shuffler() = default;

        virtual auto Shuffle(std::vector<CCardSP>& cards) -> void = 0;
    };

    class RandomShuffler final : public Shuffler
    {
    public:
        explicit RandomShuffler(uint64_t seed);

        // Uniform Fisher-Yates over the whole sequence.
        auto Shuffle(std::vector<CCardSP>& cards) -> void override;
        auto Reseed(uint64_t seed) -> void;

    private:
        std::mt19937_64 rng_;
    };

    // 52 cards, dealt from the back. Dealing past empty is a contract violation.
    class Deck
    {
    public:
        // Suit-major, Ace..King within each suit.
        Deck();

        auto Shuffle(Shuffler& shuffler) -> void;
        auto Deal() -> CCardSP;

        [[nodiscard]] auto Remaining() const noexcept -> size_t { return cards_.size(); }
        [[nodiscard]] auto Empty() const noexcept -> bool { return cards_.empty(); }
        [[nodiscard]] auto Cards() const noexcept -> std::span<CCardSP const> { return cards_; }

    private:
        std::vector<CCardSP> cards_;
    };
}

#endif //BLACKJACK_DECK_HPP
