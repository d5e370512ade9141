#ifndef FLIP7SIM_RULES_HPP
#define FLIP7SIM_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace flip7::core
{
    //forward declaration
    class Match;

    class Rules
    {
    public:
        virtual ~Rules() = default;

        // Reset every player for a new round and deal the opening card to each seat.
        virtual auto StartRound(Match& match) -> void = 0;

        // Resolve the current actor's turn into `rec`. Returns true when the round is over
        // for everyone (Flip 7).
        virtual auto PlayTurn(Match& match, TurnRecord& rec) -> bool = 0;

        // Bank round scores, detect the winner, rotate dealer and first actor.
        virtual auto Advance(Match& match) -> MoveOutcome = 0;
    };
}

#endif //FLIP7SIM_RULES_HPP
