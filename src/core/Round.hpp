//
// Round.hpp
//

#ifndef BLACKJACK_ROUND_HPP
#define BLACKJACK_ROUND_HPP

#include <memory>
#include <optional>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"
#include "Observer.hpp"
#include "Deck.hpp"
#include "Hand.hpp"

namespace blackjack::core::debug {struct Inspector;}
namespace blackjack::core
{
    // One player against the dealer. Owns the deck and both hands for the
    // duration of a round; Reset() discards them.
    class RoundImpl
    {
    public:
        RoundImpl() = delete;
        RoundImpl(Config const& config,
                  std::unique_ptr<Rules> rules,
                  std::unique_ptr<Player> player,
                  RoundObserver& observer);
        // Deck order comes from the given shuffler instead of a seeded one.
        RoundImpl(std::unique_ptr<Rules> rules,
                  std::unique_ptr<Player> player,
                  RoundObserver& observer,
                  std::unique_ptr<Shuffler> shuffler);

        // One state-machine step: the initial deal, one player decision, or one dealer decision.
        auto Step() -> MoveOutcome;
        // Steps from Setup until resolved. A round already in progress or finished is discarded first.
        auto PlayRound() -> Outcome;
        auto Reset() -> void;

        auto SnapshotFor() const -> std::shared_ptr<RoundSnapshot const>;

        auto PhaseNow() const noexcept      -> Phase  { return phase_; }
        auto Result() const noexcept        -> std::optional<Outcome> { return outcome_; }
        auto PlayerHand() const noexcept    -> Hand const& { return player_hand_; }
        auto DealerHand() const noexcept    -> Hand const& { return dealer_hand_; }
        auto DeckRemaining() const noexcept -> size_t { return deck_.Remaining(); }

        //allows class to directly access private data on an instance
        friend class HouseRules;
        friend struct debug::Inspector;
    private:
        auto DealTo(Party who) -> void;
        //Ends the round; throws if it was already resolved.
        auto Resolve() -> void;
        //Produces a shuffled deck
        auto BuildDeck() -> void;
        auto DealInitialHands() -> void;
        auto PlayerStep() -> MoveOutcome;
        auto DealerStep() -> MoveOutcome;
    private:
        std::unique_ptr<Rules> rules_;
        std::unique_ptr<Player> player_;
        RoundObserver& observer_;
        std::unique_ptr<Shuffler> shuffler_;

        // Authoritative state
        Deck deck_;
        Hand player_hand_;
        Hand dealer_hand_;

        Phase phase_{Phase::Setup};
        std::optional<Outcome> outcome_{};
    };
}
#endif //BLACKJACK_ROUND_HPP
