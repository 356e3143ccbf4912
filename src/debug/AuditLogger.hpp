//
// AuditLogger.hpp
//

#ifndef BLACKJACK_AUDITLOGGER_HPP
#define BLACKJACK_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Round.hpp"
#include "../core/Observer.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace blackjack::core::debug
{
    // Plain-text transcript of every round event, one line each.
    class AuditLogger final : public RoundObserver
    {
    public:
        // Throws IoError if the file cannot be opened.
        explicit AuditLogger(std::string path);
        ~AuditLogger() override;

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Session header (seed)
        auto start(std::uint64_t seed) -> void;

        // Round header, written before the first Step of a round
        auto new_round(std::uint64_t index) -> void;

        // Per decision: snapshot the player saw and what they chose
        auto turn(RoundSnapshot const& s, PlayerAction const& a) -> void;

        // Per step outcome
        auto outcome(MoveOutcome m) -> void;

        // Session footer with the number of rounds played
        auto end(std::uint64_t rounds_played) -> void;

        auto flush() -> void;

        auto OnDealt(Party who, Hand const& hand) -> void override;
        auto OnPlayerTurn(Hand const& hand) -> void override;
        auto OnInvalidAction(error::RuleViolation const& why) -> void override;
        auto OnPlayerHit(Hand const& hand) -> void override;
        auto OnDealerHit(Hand const& hand) -> void override;
        auto OnResolved(Outcome result, Hand const& player, Hand const& dealer) -> void override;

    private:
        std::ofstream out_;
    };
}

#endif //BLACKJACK_AUDITLOGGER_HPP
