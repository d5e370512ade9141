#ifndef FLIP7SIM_SIMULATION_HPP
#define FLIP7SIM_SIMULATION_HPP

#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "../core/Player.hpp"
#include "../core/Strategy.hpp"

namespace flip7::sim
{
    struct SimOptions
    {
        uint64_t seed{std::random_device{}()};
        unsigned threads{0};   // 0 = hardware concurrency
        bool verbose{false};   // progress lines on stdout
    };

    struct StrategyStats
    {
        std::string name;
        uint64_t games{};          // matches this strategy was seated in
        uint64_t wins{};
        int64_t  total_score{};    // final totals summed over matches
        uint64_t rounds_in_wins{}; // round count of each match it won
        uint64_t busts{};          // matches whose final round it busted
        uint64_t flip7s{};         // matches whose final hand held a Flip 7
        uint64_t round_busts{};    // every bust in every round
        uint64_t round_flip7s{};

        auto WinRate() const -> double;          // percent of games
        auto AvgScore() const -> double;
        auto AvgRoundsToWin() const -> double;   // over wins only

        auto Record(core::Player const& p, bool won, uint32_t rounds) -> void;
        auto Merge(StrategyStats const& other) -> void;
    };

    // Result of RunSimulation; one entry per distinct strategy name, in first-seen order.
    struct AggregateStats
    {
        uint64_t games_played{};
        size_t n_players{};
        std::vector<StrategyStats> per_strategy;

        auto Find(std::string_view name) const -> StrategyStats const*;
        // Most wins; first in seat order on ties
        auto Best() const -> StrategyStats const*;
        // busts over every seat-game of the run
        auto BustRate(StrategyStats const& s) const -> double;
    };

    // Flat row handed to the reporting sink.
    struct StatsRow
    {
        std::string strategy;
        uint64_t wins{};
        uint64_t games{};
        double win_rate{};
        double avg_final_score{};
        double avg_rounds_to_win{};
        uint64_t total_busts{};
        uint64_t flip7_count{};
        double bust_rate{};
    };

    // Every strategy sits at the same table for each of n_games matches.
    auto RunSimulation(std::vector<core::Strategy> const& strategies,
                       uint64_t n_games,
                       SimOptions const& opts = {}) -> AggregateStats;

    // Each strategy plays as seat 0 against up to three opponents sampled from the rest of the
    // pool, games_per_matchup times. Sorted by win rate, best first.
    auto RunExperiment(std::vector<core::Strategy> const& pool,
                       uint64_t games_per_matchup,
                       SimOptions const& opts = {}) -> std::vector<StrategyStats>;

    auto ToRows(AggregateStats const& agg) -> std::vector<StatsRow>;
    auto ToRows(std::vector<StrategyStats> const& stats) -> std::vector<StatsRow>;
}

#endif //FLIP7SIM_SIMULATION_HPP
