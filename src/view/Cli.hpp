//
// Cli.hpp
//

#ifndef BLACKJACK_CLI_HPP
#define BLACKJACK_CLI_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "CardView.hpp"

namespace blackjack::view
{
    struct CliConfig
    {
        std::uint64_t seed{std::random_device{}()};
        ViewStyle view{ViewStyle::Glyph};
        // stand threshold for unattended play; console input when empty
        std::optional<int> auto_stand_on{};
        // 0 = until the player declines another round
        std::uint64_t rounds{0};
        std::optional<std::string> log_path{};
    };

    inline constexpr std::string_view Usage =
        "usage: blackjack [--seed N] [--view word|glyph] [--auto N] [--rounds N] [--log PATH]\n";

    // argv[0] is skipped. The error text names the offending option.
    auto ParseArgs(int argc, char const* const* argv) -> std::expected<CliConfig, std::string>;
}

#endif //BLACKJACK_CLI_HPP
