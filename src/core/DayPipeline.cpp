//
// DayPipeline.cpp
//

#include "DayPipeline.hpp"

#include <format>
#include <print>
#include <utility>

#include "Tally.hpp"
#include "Util.hpp"

namespace lupus::core
{
    DayPipeline::DayPipeline(Roster const& roster,
                             Fanout const& fanout,
                             RandomSource& rng,
                             Identity moderator) :
        roster_{&roster},
        fanout_{&fanout},
        rng_{&rng},
        moderator_{std::move(moderator)}
    {
    }

    auto DayPipeline::Run(std::vector<Identity> const& night_deaths) -> DayReport
    {
        DayReport report{};
        AnnounceNight(night_deaths);
        Discuss(report);
        Vote(report);
        return report;
    }

    auto DayPipeline::AnnounceNight(std::vector<Identity> const& night_deaths) -> void
    {
        std::string content = "The day is coming, all the players open your eyes. ";
        if (night_deaths.empty())
        {
            content += "Last night is peaceful, no player is eliminated.";
        }
        else
        {
            content += "Last night, the following player(s) has been eliminated: " + util::Join(night_deaths, ", ");
        }
        fanout_->Broadcast(Notice(std::move(content)), RoleFilter::Any());
    }

    auto DayPipeline::Discuss(DayReport& report) -> void
    {
        Message const prompt{
            MessageKind::DayDiscuss,
            moderator_,
            std::format("Now the alive players are: {}. Given the game rules and your role, based on the "
                        "situation and the information you gain, what do you want to say to others?",
                        util::Join(roster_->Survivors(), ", "))
        };

        // one speaker at a time; everyone hears a speech before the next speaker is asked
        for (Participant const& speaker : roster_->AliveOfRole(RoleFilter::Any()))
        {
            std::optional<Message> speech = fanout_->Ask(prompt, speaker.identity);
            if (!speech) continue;

            Message relay = *speech;
            relay.kind = MessageKind::SystemNotice;
            relay.source = speaker.identity;
            fanout_->Broadcast(relay, RoleFilter::Any());

            report.speeches.push_back(std::move(*speech));
        }
    }

    auto DayPipeline::Vote(DayReport& report) -> void
    {
        std::vector<Message> votes = fanout_->Collect(
            Message{MessageKind::DayVote, moderator_, "It's time to vote. Which player do you suspect to be a wolf?"},
            RoleFilter::Any());

        votes = ResolveVotes(std::move(votes), *roster_);
        votes = FilterVoters(std::move(votes), *roster_, RoleFilter::Any());
        report.ballots = votes.size();

        std::optional<std::string> const target = CollectVotes(votes, *rng_);
        std::print("[Day] vote ({} ballots) -> {}\n", votes.size(), target.value_or("<none>"));
        if (!target) return;

        Participant const* p = roster_->Find(*target);
        if (!p || !p->alive) return;

        report.voted_out = p->identity;
        fanout_->Broadcast(Notice(std::format("The voting result is: Player {} has been eliminated.", p->identity)),
                           RoleFilter::Any());
    }

    auto DayPipeline::Notice(std::string content) const -> Message
    {
        return Message{MessageKind::SystemNotice, moderator_, std::move(content)};
    }
}
