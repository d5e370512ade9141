#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Match.hpp"
#include "../debug/Invariants.hpp"

using namespace flip7::core;

namespace
{
    auto MakeMatch(std::uint64_t seed, std::vector<Strategy> strategies) -> Match
    {
        Config cfg{};
        cfg.seed = seed;
        return Match(cfg, std::move(strategies));
    }

    auto Totals(Match const& m) -> std::vector<int>
    {
        std::vector<int> out;
        for (Player const& p : m.Players()) out.push_back(p.TotalScore());
        return out;
    }
}

TEST(Match, AlwaysStayPlaysOneTurnPerSeat)
{
    for (std::uint64_t seed : {1ull, 2ull, 3ull, 4ull})
    {
        Match m = MakeMatch(seed, {PointThreshold{.target = 0}, PointThreshold{.target = 0}});

        MoveOutcome out = MoveOutcome::Applied;
        std::vector<int> before = Totals(m);
        while (out != MoveOutcome::MatchEnded)
        {
            before = Totals(m);
            uint32_t steps{};
            do
            {
                out = m.Step();
                ++steps;
                ASSERT_NO_THROW(debug::CheckInvariants(m));
            } while (out == MoveOutcome::Applied);
            ASSERT_EQ(steps, 2u) << "seed " << seed << " round " << m.RoundNumber();
        }

        ASSERT_TRUE(m.Winner().has_value());
        SeatIdxT const w = *m.Winner();
        std::vector<int> const after = Totals(m);

        // nobody had reached the target before the final round
        EXPECT_TRUE(std::ranges::all_of(before, [](int t) { return t < constants::TargetScore; }));
        EXPECT_GE(after[w], constants::TargetScore);
        for (SeatIdxT s = 0; s < w; ++s) EXPECT_LT(after[s], constants::TargetScore);
    }
}

TEST(Match, CardCountNeverHitsAtTarget)
{
    for (std::uint64_t seed : {10ull, 20ull, 30ull, 40ull, 50ull})
    {
        Match m = MakeMatch(seed, {CardCount{.target = 5}, BustProbability{.max_bust = 0.25},
                                   PointThreshold{.target = 45}});
        size_t hits{};
        while (!m.IsOver())
        {
            (void)m.Step();
            TurnRecord const& rec = m.LastTurn();
            if (rec.seat == 0 && rec.decision == Decision::Hit)
            {
                ++hits;
                ASSERT_LT(rec.numbers_before, 5u) << "seed " << seed;
            }
            if (rec.seat == 0 && rec.decision == Decision::Stay)
            {
                ASSERT_GE(rec.numbers_before, 5u) << "seed " << seed;
            }
        }
        EXPECT_GT(hits, 0u);
    }
}

TEST(Match, SameSeedSameMatch)
{
    std::vector<Strategy> const table{UltimateAdaptive{}, Hybrid{.min_cards = 3, .target_points = 50, .max_bust = 0.2},
                                      BustProbability{.max_bust = 0.2, .sc_aware = true}, CardCount{.target = 6}};
    Match a = MakeMatch(777, table);
    Match b = MakeMatch(777, table);

    EXPECT_EQ(a.Play(), b.Play());
    EXPECT_EQ(a.RoundNumber(), b.RoundNumber());
    EXPECT_EQ(Totals(a), Totals(b));
    EXPECT_EQ(a.GetDeck().Size(), b.GetDeck().Size());
}

TEST(Match, DealerRotatesEachRound)
{
    Match m = MakeMatch(5, {PointThreshold{.target = 0}, PointThreshold{.target = 0}, PointThreshold{.target = 0}});
    EXPECT_EQ(m.Dealer(), 0);
    EXPECT_EQ(m.Current(), 1);

    ASSERT_EQ(m.PlayRound(), MoveOutcome::RoundEnded);
    EXPECT_EQ(m.RoundNumber(), 2u);
    EXPECT_EQ(m.Dealer(), 1);
    EXPECT_EQ(m.Current(), 2);

    ASSERT_EQ(m.PlayRound(), MoveOutcome::RoundEnded);
    EXPECT_EQ(m.Dealer(), 2);
    EXPECT_EQ(m.Current(), 0);
}

TEST(Match, SnapshotReflectsTable)
{
    Match m = MakeMatch(8, {CardCount{.target = 3}, CardCount{.target = 3}, CardCount{.target = 3}});
    m.BeginRound();
    MatchSnapshot const s = m.Snapshot();
    EXPECT_EQ(s.n_players, 3);
    EXPECT_EQ(s.n_active, 3);
    EXPECT_EQ(s.round_number, 1u);
    EXPECT_EQ(s.deck_size, 208u - 3u);
    EXPECT_EQ(s.discard_size, 0u);
    // a view over the seats, not a copy
    ASSERT_EQ(s.players.size(), 3u);
    EXPECT_EQ(s.players.data(), m.Players().data());
    EXPECT_EQ(s.players[2].TotalScore(), 0);
}

TEST(Match, SingleSeatMatchFinishes)
{
    Match m = MakeMatch(12, {Hybrid{.min_cards = 2, .target_points = 40, .max_bust = 0.3}});
    EXPECT_EQ(m.Play(), 0);
    EXPECT_GE(m.PlayerAt(0).TotalScore(), 200);
}

TEST(Match, StepAfterEndThrows)
{
    Match m = MakeMatch(3, {PointThreshold{.target = 30}, CardCount{.target = 4}});
    (void)m.Play();
    EXPECT_TRUE(m.IsOver());
    EXPECT_THROW((void)m.Step(), error::StateError);
}

TEST(Match, ManySeatsUseEmergencyDeck)
{
    // eighteen seats that never stay drain even a seven-copy deck
    Match m = MakeMatch(21, std::vector<Strategy>(18, CardCount{.target = 13}));
    (void)m.Play();
    EXPECT_NO_THROW(debug::CheckInvariants(m));
    EXPECT_TRUE(m.Winner().has_value());
    EXPECT_GT(m.GetDeck().EmergencyRefills(), 0u);
    EXPECT_GT(m.GetDeck().Synthesized(), 0u);
}
