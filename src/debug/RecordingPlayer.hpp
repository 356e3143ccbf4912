//
// RecordingPlayer.hpp
//

#ifndef BLACKJACK_RECORDINGPLAYER_HPP
#define BLACKJACK_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>

#include "../core/Player.hpp"

namespace blackjack::core::debug
{
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(std::shared_ptr<const RoundSnapshot> s) -> PlayerAction override
        {
            last_snapshot_ = s;
            last_action_ = inner_->Play(std::move(s));
            has_last_ = true;
            ++decisions_;
            return last_action_;
        }

        auto HasLast() const -> bool
        {
            return has_last_;
        }

        auto Last() const -> PlayerAction const&
        {
            return last_action_;
        }

        auto LastSnapshot() const -> std::shared_ptr<const RoundSnapshot> const&
        {
            return last_snapshot_;
        }

        auto Decisions() const -> size_t
        {
            return decisions_;
        }

        // Forget the previous decision so the caller can tell whether the next Step asked for one.
        auto Clear() -> void
        {
            has_last_ = false;
            last_snapshot_.reset();
        }

    private:
        std::unique_ptr<Player> inner_;
        PlayerAction last_action_{StandAction{}}; // harmless default
        std::shared_ptr<const RoundSnapshot> last_snapshot_;
        bool has_last_{false};
        size_t decisions_{0};
    };
} // namespace blackjack::core::debug

#endif //BLACKJACK_RECORDINGPLAYER_HPP
