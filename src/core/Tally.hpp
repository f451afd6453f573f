//
// Tally.hpp: vote counting with seeded tie-break
//

#ifndef LUPUS_TALLY_HPP
#define LUPUS_TALLY_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Message.hpp"
#include "Random.hpp"
#include "Roster.hpp"

namespace lupus::core
{
    // Most-voted normalized content; ties are broken through rng.
    // Empty contents are ignored; no votes -> nullopt.
    auto CollectVotes(std::span<Message const> votes, RandomSource& rng) -> std::optional<std::string>;

    // Rewrites each vote's content to the first alive identity it mentions.
    // Votes that mention nobody alive are dropped.
    auto ResolveVotes(std::vector<Message> votes, Roster const& roster) -> std::vector<Message>;

    // Keeps votes cast by alive participants matching filter.
    auto FilterVoters(std::vector<Message> votes, Roster const& roster, RoleFilter filter) -> std::vector<Message>;
}

#endif //LUPUS_TALLY_HPP
