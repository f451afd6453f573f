//
// Invariants.hpp: deep roster/summary checks for tests
//

#ifndef LUPUS_INVARIANTS_HPP
#define LUPUS_INVARIANTS_HPP

#include <algorithm>
#include <cstddef>
#include <format>
#include <set>
#include <string>

#include "../core/Exception.hpp"
#include "../core/GameEngine.hpp"
#include "../core/Roster.hpp"
#include "../core/Util.hpp"

namespace lupus::core::debug
{
    // A second layer of checks. Throws AssertionError on the first broken invariant.
    inline auto CheckInvariants(Roster const& r) -> void
    {
#if LPS_ENABLE_TEST_HOOKS == false
        (void)r;
#else
        std::set<std::string> seen;
        std::size_t registered{};

        for (Participant const& p : r.Slots())
        {
            // 1) an open slot is never alive
            LPS_ASSERT(p.Registered() || !p.alive, "open slot marked alive");

            if (!p.Registered()) continue;
            ++registered;

            // 2) an identity holds exactly one slot
            bool const inserted = seen.insert(util::ToLower(p.identity)).second;
            LPS_ASSERT(inserted, std::format("identity '{}' holds two slots", p.identity));
        }

        // 3) filled + open == capacity
        LPS_ASSERT(registered + r.OpenSlots() == r.Capacity(), "slot accounting drifted");

        // 4) alive counts agree with the slot view
        std::size_t const alive = static_cast<std::size_t>(
            std::ranges::count_if(r.Slots(), [](Participant const& p) { return p.alive; }));
        LPS_ASSERT(alive == r.AliveCount(), "AliveCount disagrees with slots");
#endif
    }

    inline auto CheckInvariants(GameSummary const& s, Roster const& r) -> void
    {
#if LPS_ENABLE_TEST_HOOKS == false
        (void)s;
        (void)r;
#else
        CheckInvariants(r);

        // 5) every death is real and happens once
        std::set<std::string> dead;
        for (Elimination const& e : s.eliminations)
        {
            LPS_ASSERT(!r.IsAlive(e.identity), std::format("'{}' logged dead but alive", e.identity));
            LPS_ASSERT(dead.insert(util::ToLower(e.identity)).second,
                       std::format("'{}' eliminated twice", e.identity));
            LPS_ASSERT(e.round >= 1 && e.round <= s.rounds_played, "elimination outside played rounds");
        }

        // 6) nobody dies without a record
        std::size_t const registered = r.Capacity() - r.OpenSlots();
        LPS_ASSERT(registered - r.AliveCount() == s.eliminations.size(), "unlogged death");
#endif
    }
}

#endif //LUPUS_INVARIANTS_HPP
