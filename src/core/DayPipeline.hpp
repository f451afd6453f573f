//
// DayPipeline.hpp: night results, discussion, elimination vote
//

#ifndef LUPUS_DAYPIPELINE_HPP
#define LUPUS_DAYPIPELINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "Fanout.hpp"
#include "Random.hpp"
#include "Roster.hpp"

namespace lupus::core
{
    struct DayReport
    {
        std::vector<Message> speeches; // roster order of the speakers
        std::size_t ballots{};          // valid votes counted
        std::optional<Identity> voted_out;
    };

    // Like NightPipeline, reads the roster only; the engine marks the vote target dead.
    class DayPipeline
    {
    public:
        DayPipeline(Roster const& roster,
                    Fanout const& fanout,
                    RandomSource& rng,
                    Identity moderator);

        auto Run(std::vector<Identity> const& night_deaths) -> DayReport;

    private:
        auto AnnounceNight(std::vector<Identity> const& night_deaths) -> void;
        auto Discuss(DayReport& report) -> void;
        auto Vote(DayReport& report) -> void;

        auto Notice(std::string content) const -> Message;

    private:
        Roster const* roster_;
        Fanout const* fanout_;
        RandomSource* rng_;
        Identity moderator_;
    };
}

#endif //LUPUS_DAYPIPELINE_HPP
