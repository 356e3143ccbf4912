//
// Cli.cpp
//
#include "Cli.hpp"

#include <charconv>
#include <cstring>

#include <fmt/format.h>

namespace blackjack::view
{
    auto ParseArgs(int const argc, char const* const* argv) -> std::expected<CliConfig, std::string>
    {
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_str = [&]() -> std::optional<std::string_view>
            {
                if (i + 1 >= argc) { return std::nullopt; }
                return std::string_view{argv[++i]};
            };
            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                char const* end = s + std::strlen(s);
                auto res = std::from_chars(s, end, out);
                return res.ec == std::errc{} && res.ptr == end;
            };

            if (arg == "--seed")
            {
                std::uint64_t v{};
                if (!next_uint(v)) { return std::unexpected("--seed expects an unsigned integer"); }
                cfg.seed = v;
            }
            else if (arg == "--view")
            {
                auto const name = next_str();
                auto const style = name ? ParseViewStyle(*name) : std::nullopt;
                if (!style) { return std::unexpected("--view expects 'word' or 'glyph'"); }
                cfg.view = *style;
            }
            else if (arg == "--auto")
            {
                std::uint64_t v{};
                if (!next_uint(v) || v == 0 || v > 22) { return std::unexpected("--auto expects a stand threshold in 1..22"); }
                cfg.auto_stand_on = static_cast<int>(v);
            }
            else if (arg == "--rounds")
            {
                std::uint64_t v{};
                if (!next_uint(v)) { return std::unexpected("--rounds expects an unsigned integer"); }
                cfg.rounds = v;
            }
            else if (arg == "--log")
            {
                auto const path = next_str();
                if (!path) { return std::unexpected("--log expects a path"); }
                cfg.log_path = std::string{*path};
            }
            else
            {
                return std::unexpected(fmt::format("unknown option {}", arg));
            }
        }
        // unattended play never prompts, so it needs a bound
        if (cfg.auto_stand_on && cfg.rounds == 0) { cfg.rounds = 1; }
        return cfg;
    }
}
