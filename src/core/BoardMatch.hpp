//
// BoardMatch.hpp: drives two seated players through a SubGameRules game
//

#ifndef LUPUS_BOARDMATCH_HPP
#define LUPUS_BOARDMATCH_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Fanout.hpp"
#include "Messenger.hpp"
#include "Random.hpp"
#include "Roster.hpp"
#include "SubGameRules.hpp"
#include "Transport.hpp"

namespace lupus::core
{
    namespace constants
    {
        inline constexpr uint32_t DefaultMaxPlies = 100;
    }

    struct Ply
    {
        Role side{Role::White};
        Identity player;
        std::string move; // extracted move text, empty if the delivery failed
        bool applied{false};
    };

    struct MatchResult
    {
        std::optional<Identity> winner; // empty on a draw or when the cap was reached
        std::vector<Ply> plies;
    };

    // "thinking: ... move: e2e4" -> "e2e4"; without a "move:" marker the whole trimmed reply.
    auto ExtractMove(std::string_view reply) -> std::string;

    class BoardMatch
    {
    public:
        BoardMatch(std::unique_ptr<SubGameRules> rules,
                   std::shared_ptr<Transport> transport,
                   Identity moderator,
                   std::chrono::milliseconds send_timeout,
                   uint64_t seed,
                   uint32_t max_plies = constants::DefaultMaxPlies);

        // Random free side, or empty when duplicate / both sides taken.
        auto Seat(std::string_view identity) -> std::optional<Role>;

        // Requires both sides seated. White moves first.
        auto Play() -> MatchResult;

        auto Rules() const noexcept -> SubGameRules const& { return *rules_; }
        auto RosterView() const noexcept -> Roster const& { return roster_; }

    private:
        auto PlayerOf(Role side) const -> Identity;

    private:
        std::unique_ptr<SubGameRules> rules_;
        Identity moderator_;
        uint32_t max_plies_;

        SeededRandom rng_;
        Roster roster_;
        Messenger messenger_;
        Fanout fanout_;
    };
}

#endif //LUPUS_BOARDMATCH_HPP
