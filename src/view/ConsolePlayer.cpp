//
// ConsolePlayer.cpp
//
#include "ConsolePlayer.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "../core/Exception.hpp"

namespace
{
    auto Normalise(std::string_view line) -> std::string
    {
        constexpr std::string_view ws{" \t\r\n\f\v"};
        auto const first = line.find_first_not_of(ws);
        if (first == std::string_view::npos) return {};
        auto const last = line.find_last_not_of(ws);

        std::string out{line.substr(first, last - first + 1)};
        std::ranges::transform(out, out.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }
}

namespace blackjack::view
{
    auto ParseDecision(std::string_view const line) -> core::PlayerAction
    {
        std::string const cmd = Normalise(line);
        if (cmd == "h" || cmd == "hit") return core::HitAction{};
        if (cmd == "s" || cmd == "stand") return core::StandAction{};
        return core::UnrecognisedAction{std::string{line}};
    }

    ConsolePlayer::ConsolePlayer(std::istream& in, std::ostream& out) :
        in_(in), out_(out) {}

    auto ConsolePlayer::Play(std::shared_ptr<const core::RoundSnapshot> snapshot) -> core::PlayerAction
    {
        (void)snapshot;

        out_ << "Do you want to (h)it or (s)tand? " << std::flush;
        std::string line;
        if (!std::getline(in_, line))
        {
            BJK_THROW(core::error::Code::Input, "Input closed while waiting for a decision");
        }
        return ParseDecision(line);
    }

    auto AskPlayAgain(std::istream& in, std::ostream& out) -> bool
    {
        out << "\nDo you want to play again? (y/n): " << std::flush;
        std::string line;
        if (!std::getline(in, line)) return false;
        return Normalise(line) == "y";
    }
}
