//
// AuditLogger.cpp
//
#include "AuditLogger.hpp"

#include <array>
#include <string_view>
#include <utility>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

#include "../core/Exception.hpp"

using namespace blackjack::core;

namespace
{

auto s_suit(Suit const s) -> std::string_view
{
    switch (s)
    {
        case Suit::Clubs:    return "C";
        case Suit::Diamonds: return "D";
        case Suit::Hearts:   return "H";
        case Suit::Spades:   return "S";
    }
    return "?";
}

auto s_rank(Rank const r) -> std::string_view
{
    static constexpr std::array<std::string_view, 13> map{
        "A","2","3","4","5","6","7","8","9","T","J","Q","K"
    };
    return map[static_cast<size_t>(std::to_underlying(r) - 1)];
}

auto s_card(Card const& c) -> std::string
{
    return fmt::format("{}{}", s_rank(c.rank), s_suit(c.suit));
}

auto s_hand(Hand const& h) -> std::string
{
    std::string body;
    for (CCardSP const& c : h.Cards())
    {
        body += (body.empty() ? "" : ",");
        body += s_card(*c);
    }
    return fmt::format("[{}]={}", body, h.Total());
}

auto s_party(Party const p) -> std::string_view
{
    return p == Party::Player ? "player" : "dealer";
}

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, HitAction>)
            {
                return "Hit";
            }
            else if constexpr (std::is_same_v<T, StandAction>)
            {
                return "Stand";
            }
            else
            {
                return fmt::format("Unrecognised(\"{}\")", act.text);
            }
        },
        a);
}

} // namespace

namespace blackjack::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(path, std::ios::out | std::ios::trunc)
{
    if (!out_.is_open())
    {
        BJK_THROW(error::Code::Io, fmt::format("Cannot open audit log: {}", path));
    }
}

AuditLogger::~AuditLogger()
{
    if (out_.is_open())
    {
        out_.flush();
    }
}

auto AuditLogger::start(std::uint64_t const seed) -> void
{
    out_ << "# blackjack session\n";
    out_ << fmt::format("seed={}\n", seed);
}

auto AuditLogger::new_round(std::uint64_t const index) -> void
{
    out_ << fmt::format("== round {}\n", index);
}

auto AuditLogger::turn(RoundSnapshot const& s, PlayerAction const& a) -> void
{
    std::string dealer_up = "?";
    if (auto const up = s.dealer_up.lock())
    {
        dealer_up = s_card(*up);
    }
    out_ << fmt::format("turn total={} cards={} dealer_up={} deck={} action={}\n",
                        s.my_total, s.my_hand.size(), dealer_up,
                        static_cast<int>(s.deck_remaining), s_action(a));
}

auto AuditLogger::outcome(MoveOutcome const m) -> void
{
    out_ << fmt::format("step {}\n", to_string(m));
}

auto AuditLogger::end(std::uint64_t const rounds_played) -> void
{
    out_ << fmt::format("# end rounds={}\n", rounds_played);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

auto AuditLogger::OnDealt(Party const who, Hand const& hand) -> void
{
    out_ << fmt::format("deal {} {}\n", s_party(who), s_hand(hand));
}

auto AuditLogger::OnPlayerTurn(Hand const& hand) -> void
{
    out_ << fmt::format("decide {}\n", s_hand(hand));
}

auto AuditLogger::OnInvalidAction(error::RuleViolation const& why) -> void
{
    out_ << fmt::format("invalid {}\n", error::describe(why));
}

auto AuditLogger::OnPlayerHit(Hand const& hand) -> void
{
    out_ << fmt::format("hit player {}\n", s_hand(hand));
}

auto AuditLogger::OnDealerHit(Hand const& hand) -> void
{
    out_ << fmt::format("hit dealer {}\n", s_hand(hand));
}

auto AuditLogger::OnResolved(Outcome const result, Hand const& player, Hand const& dealer) -> void
{
    out_ << fmt::format("resolved player={} dealer={} -> {}\n",
                        s_hand(player), s_hand(dealer), to_string(result));
}

} // namespace blackjack::core::debug
