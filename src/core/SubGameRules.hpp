//
// SubGameRules.hpp: opaque rules for a two-sided alternating-turn game
//

#ifndef LUPUS_SUBGAMERULES_HPP
#define LUPUS_SUBGAMERULES_HPP

#include <optional>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace lupus::core
{
    // Sides are Role::White and Role::Black. BoardMatch never inspects moves;
    // it only asks the rules.
    class SubGameRules
    {
    public:
        virtual ~SubGameRules() = default;

        virtual auto IsOver() const -> bool = 0;

        // Ordinary illegal moves return false (NOT exceptions).
        virtual auto IsLegal(Role side, std::string_view move) const -> bool = 0;

        // Only called with moves IsLegal() accepted.
        virtual auto Apply(Role side, std::string_view move) -> void = 0;

        // Position and legal moves as presented to `side`.
        virtual auto Describe(Role side) const -> std::string = 0;

        // nullopt while running, on a draw, or when the cap stops the game
        virtual auto Winner() const -> std::optional<Role> = 0;
    };
}

#endif //LUPUS_SUBGAMERULES_HPP
