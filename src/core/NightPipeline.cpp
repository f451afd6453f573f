//
// NightPipeline.cpp
//

#include "NightPipeline.hpp"

#include <format>
#include <print>
#include <utility>

#include "Tally.hpp"
#include "Util.hpp"

namespace lupus::core
{
    auto NightReport::Pending() const -> std::vector<Identity>
    {
        std::vector<Identity> out;
        if (kill) out.push_back(*kill);
        if (poison) out.push_back(*poison);
        return out;
    }

    NightPipeline::NightPipeline(Roster const& roster,
                                 Fanout const& fanout,
                                 RandomSource& rng,
                                 Identity moderator) :
        roster_{&roster},
        fanout_{&fanout},
        rng_{&rng},
        moderator_{std::move(moderator)}
    {
    }

    auto NightPipeline::Run(AbilityBudget& budget) -> NightReport
    {
        NightReport report{};

        WolfVote(report);

        if (budget.HealAvailable())
        {
            WitchSave(budget, report);
        }
        // potions are exclusive within one night
        if (!report.healed && budget.PoisonAvailable())
        {
            WitchPoison(budget, report);
        }

        SeerDivine(report);
        return report;
    }

    auto NightPipeline::WolfVote(NightReport& report) -> void
    {
        std::vector<Message> votes =
            fanout_->Collect(Request(MessageKind::NightKill, "Which player do you vote to eliminate?"),
                             RoleFilter::Only(Role::Wolf));

        votes = ResolveVotes(std::move(votes), *roster_);
        votes = FilterVoters(std::move(votes), *roster_, RoleFilter::Only(Role::Wolf));

        report.most_voted = CollectVotes(votes, *rng_);
        std::print("[Night] wolf vote ({} ballots) -> {}\n", votes.size(), report.most_voted.value_or("<none>"));

        if (report.most_voted)
        {
            if (Participant const* p = roster_->Find(*report.most_voted); p && p->alive)
            {
                report.kill = p->identity;
            }
        }

        fanout_->Broadcast(Notice("The player with the most votes is: " + report.most_voted.value_or("")),
                           RoleFilter::Only(Role::Wolf));
    }

    auto NightPipeline::WitchSave(AbilityBudget& budget, NightReport& report) -> void
    {
        std::optional<Identity> const witch = FirstAlive(Role::Witch);
        if (!witch) return;

        std::optional<Message> const reply = fanout_->Ask(
            Request(MessageKind::Save,
                    "You're the witch. Tonight one player is eliminated. Would you like to resurrect this player?"),
            *witch);

        if (reply && util::Normalize(reply->content) == "yes")
        {
            budget.ConsumeHeal();
            report.healed = true;
            report.kill.reset();
            std::print("[Night] witch used the healing potion\n");
        }
    }

    auto NightPipeline::WitchPoison(AbilityBudget& budget, NightReport& report) -> void
    {
        std::optional<Identity> const witch = FirstAlive(Role::Witch);
        if (!witch) return;

        std::optional<Message> const reply = fanout_->Ask(
            Request(MessageKind::Poison,
                    "Would you like to eliminate one player? If yes, specify the player name."),
            *witch);
        if (!reply) return;

        std::string const answer = util::Normalize(reply->content);
        if (answer.empty() || answer == "no") return;

        budget.ConsumePoison();
        report.poison_used = true;
        report.poison = roster_->ResolveMention(reply->content);
        std::print("[Night] witch poisons '{}' -> {}\n", util::Trim(reply->content),
                   report.poison.value_or("<unresolved>"));
    }

    auto NightPipeline::SeerDivine(NightReport& report) -> void
    {
        std::optional<Identity> const seer = FirstAlive(Role::Seer);
        if (!seer) return;

        std::string const survivors = util::Join(roster_->Survivors(), ", ");
        std::optional<Message> const reply = fanout_->Ask(
            Request(MessageKind::Divine,
                    std::format("You're the seer. Which player in: {} would you like to check tonight?", survivors)),
            *seer);
        if (!reply || util::Trim(reply->content).empty()) return;

        std::optional<Identity> const target = roster_->ResolveMention(reply->content);
        if (!target) return;

        Role const role = *roster_->RoleOf(*target);
        report.investigation = Investigation{*target, role};

        // the seer alone learns the answer
        fanout_->Ask(Notice(std::format("The role of {} is {}", *target, ToString(role))), *seer);
    }

    auto NightPipeline::Notice(std::string content) const -> Message
    {
        return Message{MessageKind::SystemNotice, moderator_, std::move(content)};
    }

    auto NightPipeline::Request(MessageKind const kind, std::string content) const -> Message
    {
        return Message{kind, moderator_, std::move(content)};
    }

    auto NightPipeline::FirstAlive(Role const role) const -> std::optional<Identity>
    {
        std::vector<Participant> const holders = roster_->AliveOfRole(RoleFilter::Only(role));
        if (holders.empty()) return std::nullopt;
        return holders.front().identity;
    }
}
