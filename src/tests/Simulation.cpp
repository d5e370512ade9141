#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <vector>

#include "../core/Exception.hpp"
#include "../sim/Simulation.hpp"

using namespace flip7::core;
using namespace flip7::sim;

namespace
{
    auto Pool() -> std::vector<Strategy>
    {
        return {
            BustProbability{.max_bust = 0.15},
            CardCount{.target = 5},
            PointThreshold{.target = 45},
            Hybrid{.min_cards = 3, .target_points = 50, .max_bust = 0.20}
        };
    }

    auto Options(std::uint64_t seed, unsigned threads) -> SimOptions
    {
        return SimOptions{.seed = seed, .threads = threads, .verbose = false};
    }

    void ExpectSameStats(StrategyStats const& a, StrategyStats const& b)
    {
        EXPECT_EQ(a.name, b.name);
        EXPECT_EQ(a.games, b.games);
        EXPECT_EQ(a.wins, b.wins);
        EXPECT_EQ(a.total_score, b.total_score);
        EXPECT_EQ(a.rounds_in_wins, b.rounds_in_wins);
        EXPECT_EQ(a.busts, b.busts);
        EXPECT_EQ(a.flip7s, b.flip7s);
        EXPECT_EQ(a.round_busts, b.round_busts);
        EXPECT_EQ(a.round_flip7s, b.round_flip7s);
    }
}

TEST(Simulation, FullTableTotals)
{
    AggregateStats const agg = RunSimulation(Pool(), 60, Options(2024, 2));

    EXPECT_EQ(agg.games_played, 60u);
    EXPECT_EQ(agg.n_players, 4u);
    ASSERT_EQ(agg.per_strategy.size(), 4u);
    EXPECT_EQ(agg.per_strategy[0].name, "BustProb_15%");
    EXPECT_EQ(agg.per_strategy[3].name, "Hybrid_C3_P50_B20%");

    uint64_t wins{};
    for (StrategyStats const& s : agg.per_strategy)
    {
        EXPECT_EQ(s.games, 60u);
        EXPECT_LE(s.busts, s.round_busts);
        EXPECT_LE(s.flip7s, s.round_flip7s);
        wins += s.wins;
    }
    // exactly one winner per match
    EXPECT_EQ(wins, 60u);

    StrategyStats const* best = agg.Best();
    ASSERT_NE(best, nullptr);
    EXPECT_TRUE(std::ranges::all_of(agg.per_strategy, [best](StrategyStats const& s) { return s.wins <= best->wins; }));
    EXPECT_EQ(agg.Find("CardCount_5"), &agg.per_strategy[1]);
    EXPECT_EQ(agg.Find("nobody"), nullptr);
}

TEST(Simulation, IndependentOfWorkerCount)
{
    AggregateStats const one = RunSimulation(Pool(), 48, Options(99, 1));
    AggregateStats const many = RunSimulation(Pool(), 48, Options(99, 5));

    ASSERT_EQ(one.per_strategy.size(), many.per_strategy.size());
    for (size_t i{}; i < one.per_strategy.size(); ++i)
        ExpectSameStats(one.per_strategy[i], many.per_strategy[i]);
}

TEST(Simulation, DuplicateNamesMerge)
{
    std::vector<Strategy> const twins{CardCount{.target = 5}, CardCount{.target = 5}, PointThreshold{.target = 40}};
    AggregateStats const agg = RunSimulation(twins, 20, Options(5, 0));

    ASSERT_EQ(agg.per_strategy.size(), 2u);
    StrategyStats const& twin = agg.per_strategy[0];
    EXPECT_EQ(twin.games, 20u);
    EXPECT_EQ(twin.wins + agg.per_strategy[1].wins, 20u);
    // both seats' totals over the number of matches
    EXPECT_DOUBLE_EQ(twin.WinRate(), 100.0 * static_cast<double>(twin.wins) / 20.0);
    EXPECT_DOUBLE_EQ(twin.AvgScore(), static_cast<double>(twin.total_score) / 20.0);
}

TEST(Simulation, RowsCarryDerivedColumns)
{
    AggregateStats const agg = RunSimulation(Pool(), 30, Options(17, 3));
    std::vector<StatsRow> const rows = ToRows(agg);
    ASSERT_EQ(rows.size(), agg.per_strategy.size());

    for (size_t i{}; i < rows.size(); ++i)
    {
        StrategyStats const& s = agg.per_strategy[i];
        EXPECT_EQ(rows[i].strategy, s.name);
        EXPECT_DOUBLE_EQ(rows[i].win_rate, 100.0 * static_cast<double>(s.wins) / 30.0);
        EXPECT_DOUBLE_EQ(rows[i].avg_final_score, static_cast<double>(s.total_score) / 30.0);
        EXPECT_DOUBLE_EQ(rows[i].bust_rate, 100.0 * static_cast<double>(s.busts) / (30.0 * 4.0));
    }
}

TEST(Simulation, AvgRoundsToWinWithoutWins)
{
    StrategyStats s{.name = "x", .games = 3};
    EXPECT_DOUBLE_EQ(s.AvgRoundsToWin(), 0.0);
    s.wins = 2;
    s.rounds_in_wins = 30;
    EXPECT_DOUBLE_EQ(s.AvgRoundsToWin(), 15.0);
}

TEST(Simulation, RejectsBadInput)
{
    EXPECT_THROW((void)RunSimulation({}, 10, Options(1, 1)), error::ConfigError);
    EXPECT_THROW((void)RunSimulation(Pool(), 0, Options(1, 1)), error::ConfigError);
    EXPECT_THROW((void)RunSimulation({CardCount{.target = 99}}, 10, Options(1, 1)), error::ConfigError);
    EXPECT_THROW((void)RunExperiment({CardCount{.target = 5}}, 10, Options(1, 1)), error::ConfigError);
    EXPECT_THROW((void)RunExperiment(Pool(), 0, Options(1, 1)), error::ConfigError);
}

TEST(Experiment, SortedAndComplete)
{
    std::vector<StrategyStats> const out = RunExperiment(Pool(), 25, Options(31, 2));
    ASSERT_EQ(out.size(), 4u);
    for (StrategyStats const& s : out) EXPECT_EQ(s.games, 25u);
    EXPECT_TRUE(std::ranges::is_sorted(out, std::greater{}, &StrategyStats::WinRate));

    std::vector<StatsRow> const rows = ToRows(out);
    for (size_t i{}; i < rows.size(); ++i)
        EXPECT_DOUBLE_EQ(rows[i].bust_rate, 100.0 * static_cast<double>(out[i].busts) / 25.0);
}

TEST(Experiment, IndependentOfWorkerCount)
{
    std::vector<StrategyStats> const one = RunExperiment(Pool(), 20, Options(8, 1));
    std::vector<StrategyStats> const many = RunExperiment(Pool(), 20, Options(8, 7));
    ASSERT_EQ(one.size(), many.size());
    for (size_t i{}; i < one.size(); ++i) ExpectSameStats(one[i], many[i]);
}

TEST(Experiment, TwoStrategyPoolIsHeadsUp)
{
    std::vector<Strategy> const pool{CardCount{.target = 4}, PointThreshold{.target = 35}};
    std::vector<StrategyStats> const out = RunExperiment(pool, 30, Options(4, 2));
    ASSERT_EQ(out.size(), 2u);
    for (StrategyStats const& s : out)
    {
        EXPECT_EQ(s.games, 30u);
        EXPECT_LE(s.wins, 30u);
    }
}
