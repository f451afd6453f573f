//
// WinEvaluator.hpp
//

#ifndef LUPUS_WINEVALUATOR_HPP
#define LUPUS_WINEVALUATOR_HPP

#include "Roster.hpp"
#include "Types.hpp"

namespace lupus::core
{
    // Wolves win once they are at least half of the living (parity counts for them);
    // the village wins when no wolf is left.
    inline auto EvaluateWinner(Roster const& roster) -> Winner
    {
        std::size_t const alive_wolves = roster.AliveCount(Role::Wolf);
        std::size_t const alive_total = roster.AliveCount();

        if (alive_wolves * 2 >= alive_total) return Winner::Wolves;
        if (alive_wolves == 0) return Winner::Village;
        return Winner::None;
    }
}

#endif //LUPUS_WINEVALUATOR_HPP
