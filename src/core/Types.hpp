//
// Types.hpp: roles, phases, outcomes and the engine configuration
//

#ifndef LUPUS_TYPES_HPP
#define LUPUS_TYPES_HPP

#define LPS_ENABLE_TEST_HOOKS true

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lupus::core::constants
{
    inline constexpr std::string_view AnyRole = "*";
    inline constexpr std::chrono::seconds TokenLifetime{300};
}

namespace lupus::core
{
    using Identity = std::string;

    enum class Role : uint8_t
    {
        Wolf = 0,
        Villager,
        Seer,
        Witch,
        // two-sided sub-games
        White,
        Black
    };

    enum class Phase : uint8_t
    {
        Lobby,
        Night,
        Day,
        Terminal
    };

    enum class Winner : uint8_t
    {
        None,
        Wolves,
        Village
    };

    enum class Outcome : uint8_t
    {
        WolvesWin,
        VillageWin,
        NoWinner, // round cap reached
        Aborted   // lobby never filled
    };

    enum class FanoutMode : uint8_t
    {
        Sequential,
        Concurrent
    };

    // role -> number of slots, in slot order
    using RoleTable = std::vector<std::pair<Role, uint32_t>>;

    struct Config
    {
        RoleTable roles{{Role::Wolf, 2}, {Role::Villager, 2}, {Role::Seer, 1}, {Role::Witch, 1}};
        std::chrono::milliseconds registration_timeout{std::chrono::seconds(300)};
        std::chrono::milliseconds registration_poll{std::chrono::seconds(5)};
        uint32_t max_rounds{1};
        std::chrono::milliseconds send_timeout{std::chrono::seconds(30)};
        FanoutMode fanout_mode{FanoutMode::Sequential};
        uint64_t seed{std::random_device{}()};
    };

    // Selects participants by role; Any() matches every role ("*").
    class RoleFilter
    {
    public:
        static auto Any() noexcept -> RoleFilter { return RoleFilter{}; }
        static auto Only(Role r) noexcept -> RoleFilter { return RoleFilter{r}; }

        auto Matches(Role r) const noexcept -> bool { return !role_ || *role_ == r; }
        auto IsAny() const noexcept -> bool { return !role_.has_value(); }

    private:
        RoleFilter() = default;
        explicit RoleFilter(Role r) : role_{r} {}

        std::optional<Role> role_;
    };

    auto ToString(Role r) noexcept -> std::string_view;
    auto ToString(Phase p) noexcept -> std::string_view;
    auto ToString(Outcome o) noexcept -> std::string_view;
    auto RoleFromString(std::string_view s) -> std::optional<Role>;

    // "wolf:2,villager:2,seer:1,witch:1" -> RoleTable. Throws ConfigError.
    auto ParseRoleTable(std::string_view text) -> RoleTable;
    auto TotalSlots(RoleTable const& table) noexcept -> uint32_t;
}

#endif //LUPUS_TYPES_HPP
