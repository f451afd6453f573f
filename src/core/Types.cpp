//
// Types.cpp
//

#include "Types.hpp"

#include <charconv>
#include <format>
#include <numeric>

#include "Exception.hpp"
#include "Util.hpp"

namespace lupus::core
{
    auto ToString(Role r) noexcept -> std::string_view
    {
        switch (r)
        {
        case Role::Wolf: return "wolf";
        case Role::Villager: return "villager";
        case Role::Seer: return "seer";
        case Role::Witch: return "witch";
        case Role::White: return "white";
        case Role::Black: return "black";
        }
        return "unknown";
    }

    auto ToString(Phase p) noexcept -> std::string_view
    {
        switch (p)
        {
        case Phase::Lobby: return "lobby";
        case Phase::Night: return "night";
        case Phase::Day: return "day";
        case Phase::Terminal: return "terminal";
        }
        return "unknown";
    }

    auto ToString(Outcome o) noexcept -> std::string_view
    {
        switch (o)
        {
        case Outcome::WolvesWin: return "Game over: wolf win";
        case Outcome::VillageWin: return "Game over: village win";
        case Outcome::NoWinner: return "Game over: no winner";
        case Outcome::Aborted: return "Registration timeout, game cannot start";
        }
        return "unknown";
    }

    auto RoleFromString(std::string_view s) -> std::optional<Role>
    {
        std::string const v = util::Normalize(s);
        if (v == "wolf") return Role::Wolf;
        // the original tables call them "village"
        if (v == "villager" || v == "village") return Role::Villager;
        if (v == "seer") return Role::Seer;
        if (v == "witch") return Role::Witch;
        if (v == "white") return Role::White;
        if (v == "black") return Role::Black;
        return std::nullopt;
    }

    auto ParseRoleTable(std::string_view text) -> RoleTable
    {
        RoleTable table;
        for (std::string const& item : util::SplitList(text))
        {
            auto const colon = item.find(':');
            if (colon == std::string::npos)
            {
                LPS_THROW(error::Code::Config, std::format("role entry '{}' is missing ':'", item));
            }

            std::string_view const name = util::Trim(std::string_view(item).substr(0, colon));
            std::string_view const count = util::Trim(std::string_view(item).substr(colon + 1));

            std::optional<Role> const role = RoleFromString(name);
            if (!role)
            {
                LPS_THROW(error::Code::Config, std::format("unknown role '{}'", name));
            }

            uint32_t n{};
            auto const res = std::from_chars(count.data(), count.data() + count.size(), n);
            if (res.ec != std::errc{} || res.ptr != count.data() + count.size() || n == 0)
            {
                LPS_THROW(error::Code::Config, std::format("invalid slot count '{}' for role {}", count, name));
            }

            for (auto const& [r, c] : table)
            {
                if (r == *role)
                {
                    LPS_THROW(error::Code::Config, std::format("role {} listed twice", name));
                }
            }
            table.emplace_back(*role, n);
        }

        if (table.empty())
        {
            LPS_THROW(error::Code::Config, "role table is empty");
        }
        return table;
    }

    auto TotalSlots(RoleTable const& table) noexcept -> uint32_t
    {
        return std::accumulate(table.begin(), table.end(), uint32_t{0},
                               [](uint32_t acc, auto const& entry) { return acc + entry.second; });
    }
}
