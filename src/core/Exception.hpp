//
// Exception.hpp
//

#ifndef BLACKJACK_EXCEPTION_HPP
#define BLACKJACK_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>
#include "Types.hpp"
#include "Actions.hpp"

namespace blackjack::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        State, // state engine misuse (not user invalid move)
        InvalidAction, // proposed action cannot be applied
        Input, // decision source has no more input
        Io, // file or stream failure
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InputError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct IoError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Input: throw InputError(std::move(msg), c, loc);
        case Code::Io: throw IoError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define BJK_THROW(code_enum, msg) ::blackjack::core::error::fail((code_enum), (msg))
#define BJK_ASSERT(cond, msg) do { if(!(cond)) ::blackjack::core::error::fail(::blackjack::core::error::Code::Assertion, (msg)); } while(0)

    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        WrongPhase_PlayerTurnRequired,

        // Input
        Input_Unrecognised
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<std::string> input{};

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_input(std::string s) -> RuleViolation&
        {
            input = std::move(s);
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::WrongPhase_PlayerTurnRequired: return "Wrong phase (player turn required)";
        case E::Input_Unrecognised: return "Invalid choice, please enter 'h' or 's'.";
        }
        return "Unknown";
    }

    // What a person at the table is told.
    inline auto message(RuleViolation const& v) -> std::string
    {
        return std::string{to_string(v.code)};
    }

    // Message plus the carried context, for transcripts.
    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = fmt::format("{}", to_string(v.code));
        if (v.phase) s += fmt::format(" | phase={}", to_string(*v.phase));
        if (v.input) s += fmt::format(" | input=\"{}\"", *v.input);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //BLACKJACK_EXCEPTION_HPP
