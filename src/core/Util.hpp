//
// Util.hpp
//

#ifndef BLACKJACK_UTIL_HPP
#define BLACKJACK_UTIL_HPP

#include <algorithm>
#include <span>
#include <memory>
#include <utility>
#include "Types.hpp"



namespace blackjack::core::util
{
    template <typename T>
    inline auto any_invalid(std::span<T const> ptrs) -> bool
    {
        if constexpr (std::is_same_v<T, std::weak_ptr<typename T::element_type>>)
        {
            return std::ranges::any_of(ptrs, [](auto const& p) { return p.expired(); });
        }
        else if constexpr (std::is_same_v<T, std::shared_ptr<typename T::element_type>>)
        {
            return std::ranges::any_of(ptrs, [](auto const& p) { return !p; });
        }
        else
        {
            static_assert([]{return false;}(), "Ptr must be std::shared_ptr<T> or std::weak_ptr<T>");
        }
    }
    // 0..51, suit-major
    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(std::to_underlying(c.suit)) * 13
             + static_cast<uint64_t>(std::to_underlying(c.rank) - 1);
    }
    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), count_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
            ++count_;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return count_;
        }
    private:
        uint64_t cards_;
        size_t count_;
        bool contains_dup_;
    };
}

#endif //BLACKJACK_UTIL_HPP
