#ifndef FLIP7SIM_ACTIONS_HPP
#define FLIP7SIM_ACTIONS_HPP

#include <string>
#include <vector>
#include "Types.hpp"

namespace flip7::core
{
    enum class Decision : uint8_t
    {
        None,   // no strategy query this turn
        Hit,
        Stay
    };

    enum class TurnResult : uint8_t
    {
        Skipped,    // seat was not active
        Drew,       // hit and survived, still active
        Stayed,
        ForcedStay, // number-card safety valve
        Busted,
        Flip7       // ends the round for everyone
    };

    // What happened on one Step(). Draws are kept as text since a busting card is dropped.
    struct TurnRecord
    {
        SeatIdxT seat{};
        uint32_t round{};
        Decision decision{Decision::None};
        TurnResult result{TurnResult::Skipped};
        size_t numbers_before{};
        bool second_chance_used{false};
        bool triple_draw{false};
        std::vector<std::string> drawn;
        int round_score{};
    };

    enum class MoveOutcome : uint8_t
    {
        Applied,
        RoundEnded,
        MatchEnded
    };

    enum class Phase : uint8_t
    {
        Dealing,
        Playing,
        Over
    };
} // namespace flip7::core

#endif //FLIP7SIM_ACTIONS_HPP
