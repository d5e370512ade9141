#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <utility>
#include <vector>

#include "core/Exception.hpp"
#include "core/Match.hpp"
#include "core/Strategy.hpp"
#include "debug/AuditLogger.hpp"
#include "sim/Simulation.hpp"

namespace
{
    using namespace flip7::core;

    enum class Experiment
    {
        Quick,
        Bust,
        CardCount,
        Points,
        Championship
    };

    struct DriverConfig
    {
        Experiment experiment{Experiment::Quick};
        std::optional<std::uint64_t> games{};
        flip7::sim::SimOptions sim{.verbose = true};
        std::optional<std::string> transcript{};
    };

    auto ParseExperiment(std::string const& name) -> std::optional<Experiment>
    {
        if (name == "quick")        { return Experiment::Quick; }
        if (name == "bust")         { return Experiment::Bust; }
        if (name == "cardcount")    { return Experiment::CardCount; }
        if (name == "points")       { return Experiment::Points; }
        if (name == "championship") { return Experiment::Championship; }
        return std::nullopt;
    }

    auto ParseArgs(int argc, char** argv) -> DriverConfig
    {
        DriverConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--experiment")
            {
                if (i + 1 < argc)
                {
                    if (auto e = ParseExperiment(argv[++i])) { cfg.experiment = *e; }
                    else { std::print("[flip7sim] unknown experiment '{}', using quick\n", argv[i]); }
                }
            }
            else if (arg == "--games")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.games = v; }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.sim.seed = v; }
            }
            else if (arg == "--threads")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.sim.threads = static_cast<unsigned>(v); }
            }
            else if (arg == "--transcript")
            {
                if (i + 1 < argc) { cfg.transcript = argv[++i]; }
            }
        }
        return cfg;
    }

    auto Pool(Experiment e) -> std::vector<Strategy>
    {
        std::vector<Strategy> pool;
        switch (e)
        {
        case Experiment::Bust:
            for (int pct = 0; pct <= 100; pct += 5)
                pool.emplace_back(BustProbability{.max_bust = pct / 100.0});
            break;
        case Experiment::CardCount:
            for (int n = 2; n <= 7; ++n)
                pool.emplace_back(CardCount{.target = n});
            break;
        case Experiment::Points:
            for (int pts = 20; pts <= 80; pts += 5)
                pool.emplace_back(PointThreshold{.target = pts});
            break;
        case Experiment::Championship:
            pool = {
                BustProbability{.max_bust = 0.15},
                BustProbability{.max_bust = 0.20},
                BustProbability{.max_bust = 0.25},
                CardCount{.target = 5},
                PointThreshold{.target = 45},
                PointThreshold{.target = 50},
                Hybrid{.min_cards = 3, .target_points = 50, .max_bust = 0.20},
                Hybrid{.min_cards = 4, .target_points = 45, .max_bust = 0.25}
            };
            break;
        case Experiment::Quick:
            pool = {
                BustProbability{.max_bust = 0.15},
                BustProbability{.max_bust = 0.25},
                CardCount{.target = 5},
                PointThreshold{.target = 45},
                Hybrid{.min_cards = 3, .target_points = 50, .max_bust = 0.20}
            };
            break;
        }
        return pool;
    }

    auto DefaultGames(Experiment e) -> std::uint64_t
    {
        switch (e)
        {
        case Experiment::Bust:         return 500;
        case Experiment::CardCount:    return 1000;
        case Experiment::Points:       return 500;
        case Experiment::Championship: return 2000;
        case Experiment::Quick:        return 100;
        }
        return 100;
    }

    auto Title(Experiment e) -> char const*
    {
        switch (e)
        {
        case Experiment::Bust:         return "EXPERIMENT 1: Bust Probability Strategies (0% to 100%)";
        case Experiment::CardCount:    return "EXPERIMENT 2: Card Count Strategies";
        case Experiment::Points:       return "EXPERIMENT 3: Point Threshold Strategies (20-80 points)";
        case Experiment::Championship: return "EXPERIMENT 4: Championship - Best Strategies Head-to-Head";
        case Experiment::Quick:        return "QUICK TEST";
        }
        return "";
    }

    // Full-table presets seat the whole pool together; the rest rotate each strategy through seat 0.
    auto IsFullTable(Experiment e) -> bool
    {
        return e == Experiment::Championship || e == Experiment::Quick;
    }

    void PrintRows(std::vector<flip7::sim::StatsRow> const& rows)
    {
        std::print("\n{:<24} {:>7} {:>7} {:>8} {:>10} {:>11} {:>7} {:>7} {:>8}\n",
                   "Strategy", "Wins", "Games", "Win_%", "AvgScore", "AvgRounds", "Busts", "Flip7", "Bust_%");
        std::print("{}\n", std::string(99, '-'));
        for (auto const& r : rows)
        {
            std::print("{:<24} {:>7} {:>7} {:>8.2f} {:>10.2f} {:>11.2f} {:>7} {:>7} {:>8.2f}\n",
                       r.strategy, r.wins, r.games, r.win_rate, r.avg_final_score,
                       r.avg_rounds_to_win, r.total_busts, r.flip7_count, r.bust_rate);
        }
    }

    // Plays a single match of up to four strategies from the pool with a full transcript.
    void WriteTranscript(std::vector<Strategy> const& pool, std::uint64_t seed, std::string const& path)
    {
        std::vector<Strategy> seats(pool.begin(), pool.begin() + static_cast<std::ptrdiff_t>(std::min<size_t>(4, pool.size())));

        Config cfg{};
        cfg.seed = seed;
        Match match(cfg, std::move(seats));

        if (auto const dir = std::filesystem::path(path).parent_path(); !dir.empty())
        {
            std::filesystem::create_directories(dir);
        }
        debug::AuditLogger log(path);
        log.start(match, seed);

        MoveOutcome outcome = MoveOutcome::Applied;
        while (outcome != MoveOutcome::MatchEnded)
        {
            outcome = match.Step();
            log.turn(match.LastTurn(), match);
            log.outcome(outcome);
            if (outcome != MoveOutcome::Applied)
            {
                log.round(match);
            }
        }
        log.end(match);

        std::print("[flip7sim] transcript written to {} (winner {} after {} rounds)\n",
                   path, match.PlayerAt(*match.Winner()).Name(), match.RoundNumber());
    }
}

int main(int argc, char** argv)
{
    using namespace flip7;

    DriverConfig const dc = ParseArgs(argc, argv);
    std::uint64_t const games = dc.games.value_or(DefaultGames(dc.experiment));
    std::vector<core::Strategy> const pool = Pool(dc.experiment);

    std::print("[flip7sim] seed {}\n", dc.sim.seed);
    std::print("\n{}\n{}\n{}\n", std::string(60, '='), Title(dc.experiment), std::string(60, '='));

    try
    {
        if (dc.transcript)
        {
            WriteTranscript(pool, dc.sim.seed, *dc.transcript);
        }

        if (IsFullTable(dc.experiment))
        {
            sim::AggregateStats const agg = sim::RunSimulation(pool, games, dc.sim);
            PrintRows(sim::ToRows(agg));
            if (auto const* best = agg.Best())
            {
                std::print("\nBest strategy: {} ({} wins, {:.2f}%)\n", best->name, best->wins, best->WinRate());
            }
        }
        else
        {
            std::vector<sim::StrategyStats> const stats = sim::RunExperiment(pool, games, dc.sim);
            PrintRows(sim::ToRows(stats));
            std::print("\nBest strategy: {} ({:.2f}% win rate)\n", stats.front().name, stats.front().WinRate());
        }
    }
    catch (core::OmegaException<core::error::Code> const& e)
    {
        std::print("{}", e);
        return 1;
    }

    return 0;
}
