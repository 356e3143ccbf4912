//
// Hand.cpp
//
#include "Hand.hpp"

#include <utility>
#include "Exception.hpp"
#include "Scoring.hpp"

namespace blackjack::core
{
    auto Hand::Add(CCardSP card) -> void
    {
        BJK_ASSERT(card, "Attempted to add a null card to a hand");
        cards_.push_back(std::move(card));
    }

    auto Hand::Total() const -> int
    {
        return HandTotal(cards_);
    }

    auto Hand::IsBust() const -> bool
    {
        return core::IsBust(Total());
    }

    auto Hand::View() const -> std::vector<CCardWP>
    {
        return std::vector<CCardWP>(cards_.cbegin(), cards_.cend());
    }
}
