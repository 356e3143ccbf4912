//
// CardView.hpp
//

#ifndef BLACKJACK_CARDVIEW_HPP
#define BLACKJACK_CARDVIEW_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "../core/Hand.hpp"
#include "../core/Types.hpp"

namespace blackjack::view
{
    // Renders a card from its rank and suit alone.
    class CardView
    {
    public:
        virtual ~CardView() = default;

        virtual auto Draw(core::Card const& card) const -> std::string = 0;
    };

    // "Jack of Hearts"
    class WordCardView final : public CardView
    {
    public:
        auto Draw(core::Card const& card) const -> std::string override;
    };

    // "J of ♥"
    class GlyphCardView final : public CardView
    {
    public:
        auto Draw(core::Card const& card) const -> std::string override;
    };

    enum class ViewStyle : uint8_t
    {
        Word,
        Glyph
    };

    auto MakeCardView(ViewStyle style) -> std::unique_ptr<CardView>;
    auto ParseViewStyle(std::string_view name) -> std::optional<ViewStyle>;

    auto RankName(core::Rank r) -> std::string;
    auto RankShort(core::Rank r) -> std::string;
    auto SuitName(core::Suit s) -> std::string_view;
    auto SuitGlyph(core::Suit s) -> std::string_view;

    // Cards joined with ", " in hand order.
    auto RenderHand(CardView const& view, core::Hand const& hand) -> std::string;
}

#endif //BLACKJACK_CARDVIEW_HPP
