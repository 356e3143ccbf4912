//
// Round.cpp
//
#include "Round.hpp"

#include <utility>
#include "Exception.hpp"

namespace blackjack::core
{
    RoundImpl::RoundImpl(Config const& config,
                         std::unique_ptr<Rules> rules,
                         std::unique_ptr<Player> player,
                         RoundObserver& observer) :
        RoundImpl(std::move(rules), std::move(player), observer,
                  std::make_unique<RandomShuffler>(config.seed))
    {
    }

    RoundImpl::RoundImpl(std::unique_ptr<Rules> rules,
                         std::unique_ptr<Player> player,
                         RoundObserver& observer,
                         std::unique_ptr<Shuffler> shuffler) :
        rules_(std::move(rules)),
        player_(std::move(player)),
        observer_(observer),
        shuffler_(std::move(shuffler))
    {
        BJK_ASSERT(rules_, "Invalid rules in round");
        BJK_ASSERT(player_, "Invalid player in round");
        BJK_ASSERT(shuffler_, "Invalid shuffler in round");
    }

    auto RoundImpl::Reset() -> void
    {
        deck_ = Deck{};
        player_hand_ = Hand{};
        dealer_hand_ = Hand{};
        phase_ = Phase::Setup;
        outcome_.reset();
    }

    auto RoundImpl::BuildDeck() -> void
    {
        deck_ = Deck{};
        deck_.Shuffle(*shuffler_);
        BJK_ASSERT(deck_.Remaining() == constants::DeckSize, "Fresh deck is not a full deck");
    }

    auto RoundImpl::DealTo(Party const who) -> void
    {
        Hand& hand = (who == Party::Player) ? player_hand_ : dealer_hand_;
        hand.Add(deck_.Deal());
    }

    auto RoundImpl::DealInitialHands() -> void
    {
        BJK_ASSERT(player_hand_.Empty() && dealer_hand_.Empty(), "Initial deal into non-empty hands");
        //alternating, dealer first
        for (size_t i{}; i < constants::InitialHandSize; ++i)
        {
            DealTo(Party::Dealer);
            observer_.OnDealt(Party::Dealer, dealer_hand_);
            DealTo(Party::Player);
            observer_.OnDealt(Party::Player, player_hand_);
        }
    }

    auto RoundImpl::SnapshotFor() const -> std::shared_ptr<RoundSnapshot const>
    {
        std::shared_ptr<RoundSnapshot> snap = std::make_shared<RoundSnapshot>();
        snap->phase = phase_;
        snap->my_hand = player_hand_.View();
        snap->my_total = player_hand_.Total();
        if (!dealer_hand_.Empty())
        {
            snap->dealer_up = dealer_hand_.Cards().front();
        }
        snap->dealer_count = static_cast<uint8_t>(dealer_hand_.Size());
        snap->deck_remaining = static_cast<uint8_t>(deck_.Remaining());
        return snap;
    }

    auto RoundImpl::Resolve() -> void
    {
        if (outcome_.has_value())
            BJK_THROW(error::Code::State, "Round resolved twice");

        outcome_ = rules_->Settle(player_hand_.Total(), dealer_hand_.Total());
        phase_ = Phase::Resolved;
        observer_.OnResolved(*outcome_, player_hand_, dealer_hand_);
    }

    auto RoundImpl::PlayerStep() -> MoveOutcome
    {
        observer_.OnPlayerTurn(player_hand_);
        PlayerAction const action = player_->Play(SnapshotFor());

        if (auto const ok = rules_->Validate(*this, action); !ok.has_value())
        {
            observer_.OnInvalidAction(ok.error());
            return MoveOutcome::Invalid;
        }
        rules_->Apply(*this, action);
        return rules_->Advance(*this);
    }

    auto RoundImpl::DealerStep() -> MoveOutcome
    {
        if (rules_->DealerDraws(dealer_hand_.Total()))
        {
            DealTo(Party::Dealer);
            observer_.OnDealerHit(dealer_hand_);
            return MoveOutcome::Applied;
        }
        Resolve();
        return MoveOutcome::RoundEnded;
    }

    auto RoundImpl::Step() -> MoveOutcome
    {
        switch (phase_)
        {
        case Phase::Setup:
            BuildDeck();
            DealInitialHands();
            phase_ = Phase::PlayerTurn;
            return MoveOutcome::Applied;
        case Phase::PlayerTurn:
            return PlayerStep();
        case Phase::DealerTurn:
            return DealerStep();
        case Phase::Resolved:
            BJK_THROW(error::Code::State, "Step on a resolved round");
        }
        BJK_THROW(error::Code::State, "Unknown phase");
    }

    auto RoundImpl::PlayRound() -> Outcome
    {
        if (phase_ != Phase::Setup) Reset();

        MoveOutcome out = MoveOutcome::Applied;
        while (out != MoveOutcome::RoundEnded)
        {
            out = Step();
        }
        BJK_ASSERT(outcome_.has_value(), "Round ended without an outcome");
        return *outcome_;
    }
}
