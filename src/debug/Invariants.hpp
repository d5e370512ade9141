#ifndef FLIP7SIM_INVARIANTS_HPP
#define FLIP7SIM_INVARIANTS_HPP

#include "../core/Exception.hpp"
#include "../core/Match.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <unordered_set>
#include <vector>

namespace flip7::core::debug
{
    // A second layer of checks over the whole match state. Throws AssertionError on the first
    // broken invariant.
    inline auto CheckInvariants(Match const& m) -> void
    {
#if F7_ENABLE_TEST_HOOKS == false
        (void)m;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(m);

    // 1) No card lives in two zones, and nothing appears beyond what was built or synthesized.
    //    Round-end hands are dropped, so the live total may be lower.
    {
        std::unordered_set<Card const*> seen;
        seen.reserve(s.built + s.synthesized);

        auto push_unique = [&](Card const* p)
        {
            F7_ASSERT(p != nullptr, "Null card in a zone");
            bool const inserted = seen.insert(p).second;
            F7_ASSERT(inserted, "Duplicate card pointer across zones");
        };

        for (auto p : s.deck)    push_unique(p);
        for (auto p : s.discard) push_unique(p);
        for (auto const& h : s.hands) for (auto const p : h) push_unique(p);

        F7_ASSERT(seen.size() <= s.built + s.synthesized, "Materialized card count exceeds built total");
    }

    // 2) A hand never holds the same number value twice (that draw busts or is cancelled).
    for (auto const& h : s.hands)
    {
        util::ValueSet values;
        for (Card const* c : h)
        {
            if (c->IsNumber()) values.Add(c->value);
        }
        F7_ASSERT(!values.ContainsDup(), "Duplicate number value in a hand");
    }

    // 3) Mid-round the actor is active whenever anyone is.
    if (s.phase == Phase::Playing && m.ActiveCount() > 0)
    {
        F7_ASSERT(m.PlayerAt(s.current_idx).IsActive(), "Current actor is not active");
    }

    // 4) Score bookkeeping.
    for (Player const& p : m.Players())
    {
        F7_ASSERT(p.TotalScore() >= 0, "Negative total score");
        F7_ASSERT(!p.HasBusted() || p.RoundScore() == 0, "Busted player with a round score");
    }

    // 5) A finished match names a winner at or above the target.
    if (s.phase == Phase::Over)
    {
        F7_ASSERT(m.Winner().has_value(), "Finished match without a winner");
        F7_ASSERT(m.PlayerAt(*m.Winner()).TotalScore() >= m.GetConfig().target_score,
                  "Winner below target score");
    }
#endif // F7_ENABLE_TEST_HOOKS == true
    }
}
#endif //FLIP7SIM_INVARIANTS_HPP
