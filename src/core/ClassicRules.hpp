#ifndef FLIP7SIM_CLASSICRULES_HPP
#define FLIP7SIM_CLASSICRULES_HPP
#include "Rules.hpp"

namespace flip7::core
{
    class ClassicRules final : public Rules
    {
    public:
        auto StartRound(Match& match) -> void override;
        auto PlayTurn(Match& match, TurnRecord& rec) -> bool override;
        auto Advance(Match& match) -> MoveOutcome override;
    };
}

#endif //FLIP7SIM_CLASSICRULES_HPP
