//
// Roster.hpp: role slots, registered identities and alive/dead state
//

#ifndef LUPUS_ROSTER_HPP
#define LUPUS_ROSTER_HPP

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "Random.hpp"
#include "Types.hpp"

namespace lupus::core
{
    struct Participant
    {
        Identity identity; // empty while the slot is open
        Role role{};
        bool alive{false};

        auto Registered() const noexcept -> bool { return !identity.empty(); }
    };

    // Not thread-safe. GameEngine is the only writer; everyone else reads
    // copies handed out by AliveOfRole()/Survivors().
    class Roster
    {
    public:
        Roster(RoleTable const& table, RandomSource& rng);

        // Empty result for an invalid or duplicate identity (case-insensitive) or a full roster.
        auto Register(std::string_view identity) -> std::optional<Role>;

        // Non-empty, no leading or trailing whitespace.
        static auto ValidIdentity(std::string_view identity) -> bool;

        // Returns the stored identity if it was alive; empty otherwise (idempotent).
        auto MarkDead(std::string_view identity) -> std::optional<Identity>;

        // Alive participants in slot order.
        auto AliveOfRole(RoleFilter filter) const -> std::vector<Participant>;
        auto Survivors() const -> std::vector<Identity>;
        // Every registered holder of a role, alive or not.
        auto PeersOf(Role role) const -> std::vector<Identity>;

        auto Find(std::string_view identity) const -> Participant const*;
        auto RoleOf(std::string_view identity) const -> std::optional<Role>;
        auto IsAlive(std::string_view identity) const -> bool;
        auto AliveCount() const -> std::size_t;
        auto AliveCount(Role role) const -> std::size_t;

        // First alive participant (slot order) whose identity occurs in text, ignoring case.
        auto ResolveMention(std::string_view text) const -> std::optional<Identity>;

        auto OpenSlots() const noexcept -> std::size_t { return open_.size(); }
        auto Capacity() const noexcept -> std::size_t { return slots_.size(); }
        auto Slots() const noexcept -> std::vector<Participant> const& { return slots_; }

    private:
        auto FindMut(std::string_view identity) -> Participant*;

    private:
        std::vector<Participant> slots_;
        std::vector<std::size_t> open_; // indices into slots_, ascending
        RandomSource* rng_;
    };
}

#endif //LUPUS_ROSTER_HPP
