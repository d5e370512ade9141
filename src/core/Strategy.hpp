#ifndef FLIP7SIM_STRATEGY_HPP
#define FLIP7SIM_STRATEGY_HPP

#include <string>
#include <variant>
#include "Exception.hpp"
#include "Player.hpp"
#include "State.hpp"

namespace flip7::core
{
    // Hit while the estimated bust chance is at or below max_bust.
    struct BustProbability
    {
        double max_bust{};
        bool sc_aware{false};
    };
    // Hit until holding `target` number cards.
    struct CardCount
    {
        int target{};
        bool sc_aware{false};
    };
    // Hit until the unbonused hand score reaches `target`.
    struct PointThreshold
    {
        int target{};
    };
    struct Hybrid
    {
        int min_cards{};
        int target_points{};
        double max_bust{};
        bool sc_aware{false};
    };
    // Tunes tolerance and target from the player count, protection and how many opponents are left.
    struct UltimateAdaptive {};

    using Strategy = std::variant<
      BustProbability, CardCount, PointThreshold, Hybrid, UltimateAdaptive>;

    // Fixed per-copy estimate: sum of distinct held values over 78. Not a live card count.
    auto BustEstimate(Hand const& hand) noexcept -> double;

    // Only called for a player still active in the round.
    auto ShouldHit(Strategy const& s, Player const& player, MatchSnapshot const& snap) -> bool;
    auto NameOf(Strategy const& s) -> std::string;
    auto Check(Strategy const& s) -> error::ConfigResult;
}

#endif //FLIP7SIM_STRATEGY_HPP
