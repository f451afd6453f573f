//
// Roster.cpp
//

#include "Roster.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

#include "Exception.hpp"
#include "Util.hpp"

namespace lupus::core
{
    Roster::Roster(RoleTable const& table, RandomSource& rng) :
        rng_{&rng}
    {
        for (auto const& [role, count] : table)
        {
            for (uint32_t i{}; i < count; ++i)
            {
                slots_.push_back(Participant{.identity = {}, .role = role, .alive = false});
            }
        }
        LPS_ASSERT(!slots_.empty(), "Roster built from an empty role table");

        open_.resize(slots_.size());
        for (std::size_t i{}; i < open_.size(); ++i) open_[i] = i;
    }

    auto Roster::Register(std::string_view const identity) -> std::optional<Role>
    {
        if (!ValidIdentity(identity)) return std::nullopt;
        if (Find(identity) != nullptr) return std::nullopt;
        if (open_.empty()) return std::nullopt;

        std::size_t const pick = rng_->Pick(open_.size());
        std::size_t const slot = open_[pick];
        open_.erase(open_.begin() + static_cast<std::ptrdiff_t>(pick));

        Participant& p = slots_[slot];
        p.identity = identity;
        p.alive = true;
        return p.role;
    }

    auto Roster::ValidIdentity(std::string_view const identity) -> bool
    {
        return !identity.empty() && util::Trim(identity).size() == identity.size();
    }

    auto Roster::MarkDead(std::string_view const identity) -> std::optional<Identity>
    {
        Participant* p = FindMut(identity);
        if (!p || !p->alive) return std::nullopt;
        p->alive = false;
        return p->identity;
    }

    auto Roster::AliveOfRole(RoleFilter const filter) const -> std::vector<Participant>
    {
        std::vector<Participant> out;
        for (Participant const& p : slots_)
        {
            if (p.alive && filter.Matches(p.role)) out.push_back(p);
        }
        return out;
    }

    auto Roster::Survivors() const -> std::vector<Identity>
    {
        std::vector<Identity> out;
        for (Participant const& p : slots_)
        {
            if (p.alive) out.push_back(p.identity);
        }
        return out;
    }

    auto Roster::PeersOf(Role const role) const -> std::vector<Identity>
    {
        std::vector<Identity> out;
        for (Participant const& p : slots_)
        {
            if (p.Registered() && p.role == role) out.push_back(p.identity);
        }
        return out;
    }

    auto Roster::Find(std::string_view const identity) const -> Participant const*
    {
        auto const it = std::ranges::find_if(slots_, [identity](Participant const& p)
        {
            return p.Registered() && util::EqualsCaseless(p.identity, identity);
        });
        return it != slots_.end() ? &*it : nullptr;
    }

    auto Roster::FindMut(std::string_view const identity) -> Participant*
    {
        return const_cast<Participant*>(std::as_const(*this).Find(identity));
    }

    auto Roster::RoleOf(std::string_view const identity) const -> std::optional<Role>
    {
        Participant const* p = Find(identity);
        return p ? std::optional<Role>{p->role} : std::nullopt;
    }

    auto Roster::IsAlive(std::string_view const identity) const -> bool
    {
        Participant const* p = Find(identity);
        return p && p->alive;
    }

    auto Roster::AliveCount() const -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(slots_, &Participant::alive));
    }

    auto Roster::AliveCount(Role const role) const -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(slots_, [role](Participant const& p)
        {
            return p.alive && p.role == role;
        }));
    }

    auto Roster::ResolveMention(std::string_view const text) const -> std::optional<Identity>
    {
        std::string const haystack = util::ToLower(text);
        for (Participant const& p : slots_)
        {
            if (!p.alive) continue;
            if (haystack.find(util::ToLower(p.identity)) != std::string::npos)
            {
                return p.identity;
            }
        }
        return std::nullopt;
    }
}
