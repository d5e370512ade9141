#ifndef FLIP7SIM_AUDITLOGGER_HPP
#define FLIP7SIM_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Match.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace flip7::core::debug
{
    // Plain-text match transcript, one line per event.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, player count, seat names)
        auto start(Match const& match, std::uint64_t seed) -> void;

        // Per Step(), from Match::LastTurn()
        auto turn(TurnRecord const& rec, Match const& match) -> void;

        auto outcome(MoveOutcome m) -> void;

        // After a round is scored: totals by seat plus pile sizes
        auto round(Match const& match) -> void;

        // Match footer (winner seat; -1 if none)
        auto end(Match const& match) -> void;

    private:
        std::ofstream out_;
    };
}

#endif //FLIP7SIM_AUDITLOGGER_HPP
