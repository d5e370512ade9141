#include "Strategy.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <type_traits>

namespace
{
    inline auto Viol(flip7::core::error::ConfigViolationCode code) -> flip7::core::error::ConfigViolation
    {
        return flip7::core::error::ConfigViolation{ .code = code };
    }

    inline auto ValidProbability(double const p) -> bool
    {
        return p >= 0.0 && p <= 1.0;   // false for NaN
    }

    inline auto Percent(double const p) -> int
    {
        return static_cast<int>(p * 100.0);
    }

    inline auto ScSuffix(bool const sc_aware) -> char const*
    {
        return sc_aware ? "_SC" : "";
    }
}

namespace flip7::core
{
    auto BustEstimate(Hand const& hand) noexcept -> double
    {
        return static_cast<double>(hand.DistinctValueSum()) / constants::NumberMassPerCopy;
    }

    static auto ProtectedThreshold(double const base, bool const sc_aware, Player const& p) -> double
    {
        if (sc_aware && p.HasSecondChance()) return std::min(1.0, base * 2.0);
        return base;
    }

    auto ShouldHit(Strategy const& s, Player const& player, MatchSnapshot const& snap) -> bool
    {
        Hand const& hand = player.GetHand();
        auto const numbers = static_cast<int>(hand.NumberCount());

        return std::visit([&]<typename T0>(T0 const& st) -> bool
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, BustProbability>)
            {
                // nothing left to draw from
                if (snap.deck_size + snap.discard_size == 0) return false;

                return BustEstimate(hand) <= ProtectedThreshold(st.max_bust, st.sc_aware, player);
            }
            else if constexpr (std::is_same_v<T, CardCount>)
            {
                int const target = (st.sc_aware && player.HasSecondChance()) ? st.target + 1 : st.target;
                return numbers < target;
            }
            else if constexpr (std::is_same_v<T, PointThreshold>)
            {
                return hand.Score() < st.target;
            }
            else if constexpr (std::is_same_v<T, Hybrid>)
            {
                if (numbers < st.min_cards) return true;

                int const score = hand.Score();
                if (score >= st.target_points)
                {
                    bool const push_on = st.sc_aware && player.HasSecondChance()
                                         && score < st.target_points + 10;
                    if (!push_on) return false;
                }
                return BustEstimate(hand) <= ProtectedThreshold(st.max_bust, st.sc_aware, player);
            }
            else if constexpr (std::is_same_v<T, UltimateAdaptive>)
            {
                int const n_players = snap.n_players;
                double tolerance = 0.20 + (n_players - 2) * 0.02;
                int target = 40 + n_players * 2;
                bool const prot = player.HasSecondChance();
                if (prot)
                {
                    tolerance = std::min(1.0, tolerance * 2.0);
                    target += 10;
                }

                if (numbers < 3) return true;
                // one more distinct card completes Flip 7
                if (numbers == 6 && prot) return true;

                double const bust = BustEstimate(hand);
                int const score = hand.Score();
                if (score >= target)
                {
                    if (prot && score < target + 15) return bust <= tolerance;
                    return false;
                }

                if (2 * static_cast<int>(snap.n_active) <= n_players) tolerance *= 0.8;
                return bust <= tolerance;
            }
            else
            {
                static_assert(sizeof(T) == 0, "Unhandled strategy alternative");
            }
        }, s);
    }

    auto NameOf(Strategy const& s) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& st) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, BustProbability>)
                return std::format("BustProb_{}%{}", Percent(st.max_bust), ScSuffix(st.sc_aware));
            else if constexpr (std::is_same_v<T, CardCount>)
                return std::format("CardCount_{}{}", st.target, ScSuffix(st.sc_aware));
            else if constexpr (std::is_same_v<T, PointThreshold>)
                return std::format("PointThreshold_{}", st.target);
            else if constexpr (std::is_same_v<T, Hybrid>)
                return std::format("Hybrid_C{}_P{}_B{}%{}", st.min_cards, st.target_points,
                                   Percent(st.max_bust), ScSuffix(st.sc_aware));
            else
                return "Ultimate_Adaptive";
        }, s);
    }

    auto Check(Strategy const& s) -> error::ConfigResult
    {
        using CVC = ::flip7::core::error::ConfigViolationCode;

        return std::visit([&]<typename T0>(T0 const& st) -> error::ConfigResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, BustProbability>)
            {
                if (!ValidProbability(st.max_bust))
                    return std::unexpected(Viol(CVC::Probability_OutOfRange)
                                           .with_strategy(NameOf(s)).with_value(st.max_bust));
                return {};
            }
            else if constexpr (std::is_same_v<T, CardCount>)
            {
                if (st.target < 1 || st.target > constants::MaxNumberValue + 1)
                    return std::unexpected(Viol(CVC::CardTarget_OutOfRange)
                                           .with_strategy(NameOf(s)).with_value(st.target));
                return {};
            }
            else if constexpr (std::is_same_v<T, PointThreshold>)
            {
                if (st.target < 0 || st.target > 1000)
                    return std::unexpected(Viol(CVC::PointTarget_OutOfRange)
                                           .with_strategy(NameOf(s)).with_value(st.target));
                return {};
            }
            else if constexpr (std::is_same_v<T, Hybrid>)
            {
                if (st.min_cards < 0 || st.min_cards > constants::MaxNumberValue + 1)
                    return std::unexpected(Viol(CVC::MinCards_OutOfRange)
                                           .with_strategy(NameOf(s)).with_value(st.min_cards));
                if (st.target_points < 0 || st.target_points > 1000)
                    return std::unexpected(Viol(CVC::PointTarget_OutOfRange)
                                           .with_strategy(NameOf(s)).with_value(st.target_points));
                if (!ValidProbability(st.max_bust))
                    return std::unexpected(Viol(CVC::Probability_OutOfRange)
                                           .with_strategy(NameOf(s)).with_value(st.max_bust));
                return {};
            }
            else
            {
                return {};
            }
        }, s);
    }
}
