//
// Hand.hpp
//

#ifndef BLACKJACK_HAND_HPP
#define BLACKJACK_HAND_HPP

#include <span>
#include <vector>
#include "Types.hpp"

namespace blackjack::core
{
    // Cards held by one party. Grows one card at a time, never shrinks.
    class Hand
    {
    public:
        Hand() = default;

        auto Add(CCardSP card) -> void;

        // Recomputed on every call, never cached.
        [[nodiscard]] auto Total() const -> int;
        [[nodiscard]] auto IsBust() const -> bool;

        [[nodiscard]] auto Cards() const noexcept -> std::span<CCardSP const> { return cards_; }
        [[nodiscard]] auto Size() const noexcept -> size_t { return cards_.size(); }
        [[nodiscard]] auto Empty() const noexcept -> bool { return cards_.empty(); }

        auto View() const -> std::vector<CCardWP>;

    private:
        std::vector<CCardSP> cards_;
    };
}

#endif //BLACKJACK_HAND_HPP
