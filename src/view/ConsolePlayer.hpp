//
// ConsolePlayer.hpp
//

#ifndef BLACKJACK_CONSOLEPLAYER_HPP
#define BLACKJACK_CONSOLEPLAYER_HPP

#include <istream>
#include <ostream>
#include <string_view>

#include "../core/Player.hpp"

namespace blackjack::view
{
    // Maps one line of input onto a decision. "h"/"hit" and "s"/"stand",
    // case-insensitive, surrounding whitespace ignored.
    auto ParseDecision(std::string_view line) -> core::PlayerAction;

    // Reads one decision per call; blocks on the stream.
    // Throws InputError once the stream is exhausted.
    class ConsolePlayer final : public core::Player
    {
    public:
        ConsolePlayer(std::istream& in, std::ostream& out);

        auto Play(std::shared_ptr<const core::RoundSnapshot> snapshot) -> core::PlayerAction override;

    private:
        std::istream& in_;
        std::ostream& out_;
    };

    // "y" (any case) continues; anything else, including end of input, stops.
    auto AskPlayAgain(std::istream& in, std::ostream& out) -> bool;
}

#endif //BLACKJACK_CONSOLEPLAYER_HPP
