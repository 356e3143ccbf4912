//
// CardView.cpp
//
#include "CardView.hpp"

#include <string>
#include <utility>
#include "../core/Exception.hpp"

namespace blackjack::view
{
    using core::Rank;
    using core::Suit;

    auto RankName(Rank const r) -> std::string
    {
        switch (r)
        {
        case Rank::Ace: return "Ace";
        case Rank::Jack: return "Jack";
        case Rank::Queen: return "Queen";
        case Rank::King: return "King";
        default: return std::to_string(std::to_underlying(r));
        }
    }

    auto RankShort(Rank const r) -> std::string
    {
        switch (r)
        {
        case Rank::Ace: return "A";
        case Rank::Jack: return "J";
        case Rank::Queen: return "Q";
        case Rank::King: return "K";
        default: return std::to_string(std::to_underlying(r));
        }
    }

    auto SuitName(Suit const s) -> std::string_view
    {
        switch (s)
        {
        case Suit::Hearts: return "Hearts";
        case Suit::Diamonds: return "Diamonds";
        case Suit::Spades: return "Spades";
        case Suit::Clubs: return "Clubs";
        }
        return "?";
    }

    auto SuitGlyph(Suit const s) -> std::string_view
    {
        switch (s)
        {
        case Suit::Hearts: return "♥";
        case Suit::Diamonds: return "♦";
        case Suit::Spades: return "♠";
        case Suit::Clubs: return "♣";
        }
        return "?";
    }

    auto WordCardView::Draw(core::Card const& card) const -> std::string
    {
        return RankName(card.rank) + " of " + std::string{SuitName(card.suit)};
    }

    auto GlyphCardView::Draw(core::Card const& card) const -> std::string
    {
        return RankShort(card.rank) + " of " + std::string{SuitGlyph(card.suit)};
    }

    auto MakeCardView(ViewStyle const style) -> std::unique_ptr<CardView>
    {
        switch (style)
        {
        case ViewStyle::Word: return std::make_unique<WordCardView>();
        case ViewStyle::Glyph: return std::make_unique<GlyphCardView>();
        }
        BJK_THROW(core::error::Code::Unknown, "Unknown view style");
    }

    auto ParseViewStyle(std::string_view const name) -> std::optional<ViewStyle>
    {
        if (name == "word") return ViewStyle::Word;
        if (name == "glyph") return ViewStyle::Glyph;
        return std::nullopt;
    }

    auto RenderHand(CardView const& view, core::Hand const& hand) -> std::string
    {
        std::string out;
        for (core::CCardSP const& c : hand.Cards())
        {
            if (!out.empty()) out += ", ";
            out += view.Draw(*c);
        }
        return out;
    }
}
