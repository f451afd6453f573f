//
// Tally.cpp
//

#include "Tally.hpp"

#include <algorithm>
#include <map>
#include <ranges>
#include <utility>
#include <vector>

#include "Util.hpp"

namespace lupus::core
{
    auto CollectVotes(std::span<Message const> const votes, RandomSource& rng) -> std::optional<std::string>
    {
        // std::map keeps the tied set sorted, so the draw does not depend on arrival order
        std::map<std::string, std::size_t> counts;
        for (Message const& v : votes)
        {
            std::string target = util::Normalize(v.content);
            if (target.empty()) continue;
            ++counts[std::move(target)];
        }

        if (counts.empty()) return std::nullopt;

        std::size_t const max_votes = std::ranges::max(counts | std::views::values);

        std::vector<std::string> leaders;
        for (auto const& [target, n] : counts)
        {
            if (n == max_votes) leaders.push_back(target);
        }

        if (leaders.size() == 1) return leaders.front();
        return leaders[rng.Pick(leaders.size())];
    }

    auto ResolveVotes(std::vector<Message> votes, Roster const& roster) -> std::vector<Message>
    {
        std::vector<Message> out;
        out.reserve(votes.size());
        for (Message& v : votes)
        {
            std::optional<Identity> who = roster.ResolveMention(v.content);
            if (!who) continue;
            v.content = std::move(*who);
            out.push_back(std::move(v));
        }
        return out;
    }

    auto FilterVoters(std::vector<Message> votes, Roster const& roster, RoleFilter const filter)
        -> std::vector<Message>
    {
        std::erase_if(votes, [&](Message const& v)
        {
            Participant const* p = roster.Find(v.source);
            return !p || !p->alive || !filter.Matches(p->role);
        });
        return votes;
    }
}
