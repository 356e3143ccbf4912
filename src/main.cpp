//
// main.cpp
//
// Interactive blackjack against the house dealer.
//

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>

#include <fmt/format.h>

#include "core/Round.hpp"
#include "core/HouseRules.hpp"
#include "core/RandomAi.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/RecordingPlayer.hpp"
#include "view/CardView.hpp"
#include "view/Cli.hpp"
#include "view/ConsoleObserver.hpp"
#include "view/ConsolePlayer.hpp"

int main(int argc, char** argv)
{
    using namespace blackjack;
    using namespace blackjack::core;

    auto const parsed = view::ParseArgs(argc, argv);
    if (!parsed)
    {
        fmt::print(stderr, "[blackjack] {}\n{}", parsed.error(), view::Usage);
        return 2;
    }
    view::CliConfig const cc = *parsed;

    fmt::print(stderr, "[blackjack] seed {}\n", cc.seed);

    std::unique_ptr<view::CardView> const card_view = view::MakeCardView(cc.view);
    view::ConsoleObserver console(*card_view, std::cout);
    FanoutObserver sinks;
    sinks.Add(console);

    std::unique_ptr<debug::AuditLogger> audit;
    std::uint64_t played{0};
    try
    {
        if (cc.log_path)
        {
            audit = std::make_unique<debug::AuditLogger>(*cc.log_path);
            audit->start(cc.seed);
            sinks.Add(*audit);
        }

        std::unique_ptr<Player> inner;
        if (cc.auto_stand_on)
        {
            inner = std::make_unique<ThresholdAI>(*cc.auto_stand_on);
        }
        else
        {
            inner = std::make_unique<view::ConsolePlayer>(std::cin, std::cout);
        }
        auto recorder = std::make_unique<debug::RecordingPlayer>(std::move(inner));
        debug::RecordingPlayer* rec = recorder.get();

        RoundImpl round(Config{.seed = cc.seed}, std::make_unique<HouseRules>(), std::move(recorder), sinks);

        for (;;)
        {
            ++played;
            round.Reset();
            if (audit) { audit->new_round(played); }

            MoveOutcome out = MoveOutcome::Applied;
            while (out != MoveOutcome::RoundEnded)
            {
                rec->Clear();
                out = round.Step();
                if (audit)
                {
                    if (rec->HasLast()) { audit->turn(*rec->LastSnapshot(), rec->Last()); }
                    audit->outcome(out);
                }
            }

            if (cc.rounds != 0 && played >= cc.rounds) { break; }
            if (!cc.auto_stand_on && !view::AskPlayAgain(std::cin, std::cout)) { break; }
        }
    }
    catch (error::InputError const& e)
    {
        fmt::print(stderr, "\n[blackjack] {}\n", e.what());
    }
    catch (OmegaException<error::Code> const& e)
    {
        fmt::print(stderr, "[blackjack] {}", e);
        return 1;
    }

    if (audit) { audit->end(played); }
    return 0;
}
