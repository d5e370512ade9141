#include "Simulation.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <iterator>
#include <print>
#include <ranges>
#include <thread>
#include <utility>

#include "../core/Exception.hpp"
#include "../core/Match.hpp"
#include "../core/Util.hpp"

using namespace flip7::core;

namespace
{
    using Accum = std::vector<flip7::sim::StrategyStats>;
    using CVC = error::ConfigViolationCode;

    constexpr size_t MaxOpponents = 3;

    auto CheckPool(std::vector<Strategy> const& pool, size_t const min_size, uint64_t const n_games)
        -> error::ConfigResult
    {
        if (pool.empty())
            return std::unexpected(error::ConfigViolation{.code = CVC::NoStrategies});
        if (pool.size() < min_size)
            return std::unexpected(error::ConfigViolation{.code = CVC::TooFewForExperiment}.with_count(pool.size()));
        if (n_games == 0)
            return std::unexpected(error::ConfigViolation{.code = CVC::ZeroGames});
        for (Strategy const& s : pool)
        {
            if (auto r = Check(s); !r.has_value()) return r;
        }
        return {};
    }

    auto WorkerCount(unsigned const requested, uint64_t const n_jobs) -> unsigned
    {
        unsigned w = requested != 0 ? requested : std::thread::hardware_concurrency();
        w = std::max(w, 1u);
        return static_cast<unsigned>(std::min<uint64_t>(w, n_jobs));
    }

    // Splits [0, n_jobs) into contiguous ranges, one per worker. Each worker owns its
    // accumulator; they are merged once every worker has finished.
    auto ParallelAccumulate(uint64_t const n_jobs,
                            size_t const n_slots,
                            flip7::sim::SimOptions const& opts,
                            std::function<void(uint64_t, Accum&)> const& job) -> Accum
    {
        unsigned const workers = WorkerCount(opts.threads, n_jobs);
        uint64_t const log_interval = std::max<uint64_t>(n_jobs / workers / 10, 1);

        std::vector<std::future<Accum>> parts;
        parts.reserve(workers);
        for (unsigned w{}; w < workers; ++w)
        {
            uint64_t const begin = n_jobs * w / workers;
            uint64_t const end = n_jobs * (w + 1) / workers;
            parts.push_back(std::async(std::launch::async,
                [&job, &opts, begin, end, n_slots, w, log_interval, workers]
                {
                    Accum acc(n_slots);
                    for (uint64_t i{begin}; i < end; ++i)
                    {
                        job(i, acc);
                        if (opts.verbose && w == 0 && (i - begin + 1) % log_interval == 0)
                            std::print("  Completed {}/{} games on worker 0 ({} workers)...\n",
                                       i - begin + 1, end - begin, workers);
                    }
                    return acc;
                }));
        }

        Accum total(n_slots);
        for (std::future<Accum>& f : parts)
        {
            Accum const part = f.get();
            for (size_t s{}; s < n_slots; ++s)
                total[s].Merge(part[s]);
        }
        return total;
    }
}

namespace flip7::sim
{
    auto StrategyStats::WinRate() const -> double
    {
        return games == 0 ? 0.0 : 100.0 * static_cast<double>(wins) / static_cast<double>(games);
    }

    auto StrategyStats::AvgScore() const -> double
    {
        return games == 0 ? 0.0 : static_cast<double>(total_score) / static_cast<double>(games);
    }

    auto StrategyStats::AvgRoundsToWin() const -> double
    {
        return static_cast<double>(rounds_in_wins) / static_cast<double>(std::max<uint64_t>(wins, 1));
    }

    auto StrategyStats::Record(Player const& p, bool const won, uint32_t const rounds) -> void
    {
        ++games;
        total_score += p.TotalScore();
        if (won)
        {
            ++wins;
            rounds_in_wins += rounds;
        }
        if (p.HasBusted()) ++busts;
        if (p.GetHand().HasFlip7()) ++flip7s;
        round_busts += p.Busts();
        round_flip7s += p.Flip7s();
    }

    auto StrategyStats::Merge(StrategyStats const& other) -> void
    {
        games += other.games;
        wins += other.wins;
        total_score += other.total_score;
        rounds_in_wins += other.rounds_in_wins;
        busts += other.busts;
        flip7s += other.flip7s;
        round_busts += other.round_busts;
        round_flip7s += other.round_flip7s;
    }

    auto AggregateStats::Find(std::string_view const name) const -> StrategyStats const*
    {
        auto const it = std::ranges::find(per_strategy, name, &StrategyStats::name);
        return it != per_strategy.end() ? &*it : nullptr;
    }

    auto AggregateStats::Best() const -> StrategyStats const*
    {
        if (per_strategy.empty()) return nullptr;
        // max_element keeps the first of equal maxima
        return &*std::ranges::max_element(per_strategy, std::less{}, &StrategyStats::wins);
    }

    auto AggregateStats::BustRate(StrategyStats const& s) const -> double
    {
        auto const seat_games = games_played * n_players;
        return seat_games == 0 ? 0.0 : 100.0 * static_cast<double>(s.busts) / static_cast<double>(seat_games);
    }

    auto RunSimulation(std::vector<Strategy> const& strategies,
                       uint64_t const n_games,
                       SimOptions const& opts) -> AggregateStats
    {
        error::require(CheckPool(strategies, 1, n_games));

        if (opts.verbose)
        {
            std::print("\nRunning {} games with {} bots...\n", n_games, strategies.size());
            for (Strategy const& s : strategies) std::print("  {}\n", NameOf(s));
        }

        Accum const by_seat = ParallelAccumulate(n_games, strategies.size(), opts,
            [&strategies, &opts](uint64_t const game, Accum& acc)
            {
                Config cfg{};
                cfg.seed = util::MixSeed(opts.seed, game);
                Match match(cfg, strategies);
                SeatIdxT const winner = match.Play();
                for (Player const& p : match.Players())
                {
                    acc[p.Seat()].Record(p, p.Seat() == winner, match.RoundNumber());
                }
            });

        AggregateStats agg{};
        agg.games_played = n_games;
        agg.n_players = strategies.size();
        for (size_t seat{}; seat < strategies.size(); ++seat)
        {
            std::string name = NameOf(strategies[seat]);
            auto it = std::ranges::find(agg.per_strategy, name, &StrategyStats::name);
            if (it == agg.per_strategy.end())
            {
                agg.per_strategy.push_back(StrategyStats{.name = std::move(name)});
                it = std::prev(agg.per_strategy.end());
            }
            it->Merge(by_seat[seat]);
        }
        // twin seats share one match each; rates are per match, not per seat
        for (StrategyStats& s : agg.per_strategy) s.games = n_games;
        return agg;
    }

    auto RunExperiment(std::vector<Strategy> const& pool,
                       uint64_t const games_per_matchup,
                       SimOptions const& opts) -> std::vector<StrategyStats>
    {
        error::require(CheckPool(pool, 2, games_per_matchup));

        size_t const n_opponents = std::min(MaxOpponents, pool.size() - 1);
        if (opts.verbose)
            std::print("\nTesting {} strategies in {}-player games\n", pool.size(), n_opponents + 1);

        uint64_t const n_jobs = pool.size() * games_per_matchup;
        Accum out = ParallelAccumulate(n_jobs, pool.size(), opts,
            [&pool, &opts, games_per_matchup, n_opponents](uint64_t const job, Accum& acc)
            {
                size_t const hero = static_cast<size_t>(job / games_per_matchup);

                std::mt19937_64 pick{util::MixSeed(opts.seed, 2 * job)};
                std::vector<size_t> others;
                others.reserve(pool.size() - 1);
                for (size_t i{}; i < pool.size(); ++i)
                {
                    if (i != hero) others.push_back(i);
                }
                std::ranges::shuffle(others, pick);

                std::vector<Strategy> seats;
                seats.reserve(n_opponents + 1);
                seats.push_back(pool[hero]);
                for (size_t k{}; k < n_opponents; ++k)
                    seats.push_back(pool[others[k]]);

                Config cfg{};
                cfg.seed = util::MixSeed(opts.seed, 2 * job + 1);
                Match match(cfg, std::move(seats));
                SeatIdxT const winner = match.Play();
                acc[hero].Record(match.PlayerAt(0), winner == 0, match.RoundNumber());
            });

        for (size_t i{}; i < pool.size(); ++i)
            out[i].name = NameOf(pool[i]);

        std::ranges::stable_sort(out, std::greater{}, &StrategyStats::WinRate);
        return out;
    }

    static auto MakeRow(StrategyStats const& s, double const bust_rate) -> StatsRow
    {
        return StatsRow{
            .strategy          = s.name,
            .wins              = s.wins,
            .games             = s.games,
            .win_rate          = s.WinRate(),
            .avg_final_score   = s.AvgScore(),
            .avg_rounds_to_win = s.AvgRoundsToWin(),
            .total_busts       = s.busts,
            .flip7_count       = s.flip7s,
            .bust_rate         = bust_rate
        };
    }

    auto ToRows(AggregateStats const& agg) -> std::vector<StatsRow>
    {
        return agg.per_strategy
             | std::views::transform([&agg](StrategyStats const& s) { return MakeRow(s, agg.BustRate(s)); })
             | std::ranges::to<std::vector<StatsRow>>();
    }

    auto ToRows(std::vector<StrategyStats> const& stats) -> std::vector<StatsRow>
    {
        return stats
             | std::views::transform([](StrategyStats const& s)
                 {
                     double const rate = s.games == 0 ? 0.0
                                         : 100.0 * static_cast<double>(s.busts) / static_cast<double>(s.games);
                     return MakeRow(s, rate);
                 })
             | std::ranges::to<std::vector<StatsRow>>();
    }
}
