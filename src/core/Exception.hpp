#ifndef FLIP7SIM_EXCEPTION_HPP
#define FLIP7SIM_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace flip7::core::error
{
    enum class Code : unsigned
    {
        State, // match state misuse
        Config, // invalid strategy/match/simulation configuration
        Assertion // internal assertion failed
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::State: throw StateError(std::move(msg), c);
        case Code::Config: throw ConfigError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define F7_THROW(code_enum, msg) ::flip7::core::error::fail((code_enum), (msg))
#define F7_ASSERT(cond, msg) do { if(!(cond)) ::flip7::core::error::fail(::flip7::core::error::Code::Assertion, (msg)); } while(0)

    // Reasons a strategy or match setup is rejected before play starts.
    enum class ConfigViolationCode : std::uint16_t
    {
        NoStrategies,
        TooManySeats,
        TooFewForExperiment,
        ZeroGames,

        Probability_OutOfRange,
        CardTarget_OutOfRange,
        PointTarget_OutOfRange,
        MinCards_OutOfRange,

        // Safety net
        Internal_Unreachable
    };

    struct ConfigViolation
    {
        ConfigViolationCode code{};
        std::optional<std::string> strategy{};
        std::optional<double> value{};
        std::optional<std::size_t> count{};

        auto with_strategy(std::string name) -> ConfigViolation&
        {
            strategy = std::move(name);
            return *this;
        }

        auto with_value(double v) -> ConfigViolation&
        {
            value = v;
            return *this;
        }

        auto with_count(std::size_t n) -> ConfigViolation&
        {
            count = n;
            return *this;
        }
    };

    inline auto to_string(ConfigViolationCode c) -> std::string_view
    {
        using E = ConfigViolationCode;
        switch (c)
        {
        case E::NoStrategies: return "No strategies supplied";
        case E::TooManySeats: return "More strategies than seats";
        case E::TooFewForExperiment: return "Experiment needs at least two strategies";
        case E::ZeroGames: return "Game count must be positive";
        case E::Probability_OutOfRange: return "Bust probability outside [0, 1]";
        case E::CardTarget_OutOfRange: return "Card target outside [1, 13]";
        case E::PointTarget_OutOfRange: return "Point target outside [0, 1000]";
        case E::MinCards_OutOfRange: return "Minimum card count outside [0, 13]";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(ConfigViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.strategy) s += std::format(" | strategy={}", *v.strategy);
        if (v.value) s += std::format(" | value={}", *v.value);
        if (v.count) s += std::format(" | count={}", *v.count);
        return s;
    }

    using ConfigResult = std::expected<void, ConfigViolation>;

    // Throws ConfigError carrying the described violation.
    inline auto require(ConfigResult const& r) -> void
    {
        if (!r.has_value())
            F7_THROW(Code::Config, describe(r.error()));
    }
}

#endif //FLIP7SIM_EXCEPTION_HPP
