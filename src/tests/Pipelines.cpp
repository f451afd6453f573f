#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "../core/DayPipeline.hpp"
#include "../core/Fanout.hpp"
#include "../core/LocalTransport.hpp"
#include "../core/Messenger.hpp"
#include "../core/NightPipeline.hpp"
#include "../core/Roster.hpp"
#include "TestAgents.hpp"

using namespace lupus::core;
using namespace std::chrono_literals;
using Inbox = lupus::test::ScriptedAgent::Inbox;

namespace
{
// alice, bob = wolves; carol, dave = villagers; erin = seer; frank = witch
struct Village
{
    std::shared_ptr<LocalTransport> transport = std::make_shared<LocalTransport>();
    lupus::test::FixedRandom rng;
    Roster roster{RoleTable{{Role::Wolf, 2}, {Role::Villager, 2}, {Role::Seer, 1}, {Role::Witch, 1}}, rng};
    Messenger messenger{transport, "moderator", 500ms};
    Fanout fanout{roster, messenger, FanoutMode::Sequential};
    std::map<Identity, std::shared_ptr<Inbox>> inbox;

    Village()
    {
        lupus::test::Fill(roster, {"alice", "bob", "carol", "dave", "erin", "frank"});
    }

    auto Script(Identity const& id, std::map<MessageKind, std::string> answers) -> void
    {
        inbox[id] = lupus::test::RegisterScripted(*transport, id, std::move(answers));
    }

    auto Night(std::string const& save, std::string const& poison) -> void
    {
        Script("alice", {{MessageKind::NightKill, "carol"}});
        Script("bob", {{MessageKind::NightKill, "I vote Carol"}});
        Script("carol", {});
        Script("dave", {});
        Script("erin", {{MessageKind::Divine, "alice"}});
        Script("frank", {{MessageKind::Save, save}, {MessageKind::Poison, poison}});
    }
};

auto Contents(std::vector<Message> const& seen, MessageKind kind) -> std::vector<std::string>
{
    std::vector<std::string> out;
    for (Message const& m : seen)
    {
        if (m.kind == kind) out.push_back(m.content);
    }
    return out;
}
} // anonymous namespace

TEST(NightPipeline, WolvesAgreeAndWitchDeclinesBoth)
{
    Village v;
    v.Night("no", "no");

    AbilityBudget budget;
    NightPipeline night(v.roster, v.fanout, v.rng, "moderator");
    NightReport const report = night.Run(budget);

    EXPECT_EQ(report.most_voted, std::optional<std::string>{"carol"});
    EXPECT_EQ(report.Pending(), (std::vector<Identity>{"carol"}));
    EXPECT_FALSE(report.healed);
    EXPECT_FALSE(report.poison_used);
    EXPECT_TRUE(budget.HealAvailable());
    EXPECT_TRUE(budget.PoisonAvailable());

    // the pipeline only reports; nobody is dead yet
    EXPECT_TRUE(v.roster.IsAlive("carol"));

    ASSERT_TRUE(report.investigation.has_value());
    EXPECT_EQ(report.investigation->target, "alice");
    EXPECT_EQ(report.investigation->role, Role::Wolf);

    std::vector<std::string> const seer_notes = Contents(v.inbox["erin"]->Snapshot(), MessageKind::SystemNotice);
    ASSERT_FALSE(seer_notes.empty());
    EXPECT_EQ(seer_notes.back(), "The role of alice is wolf");

    // wolves hear the tally, villagers hear nothing at night
    EXPECT_EQ(Contents(v.inbox["alice"]->Snapshot(), MessageKind::SystemNotice),
              (std::vector<std::string>{"The player with the most votes is: carol"}));
    EXPECT_TRUE(v.inbox["dave"]->Snapshot().empty());
}

TEST(NightPipeline, HealSkipsPoisonTheSameNight)
{
    Village v;
    v.Night("Yes", "dave");

    AbilityBudget budget;
    NightPipeline night(v.roster, v.fanout, v.rng, "moderator");
    NightReport const report = night.Run(budget);

    EXPECT_TRUE(report.healed);
    EXPECT_TRUE(report.Pending().empty());
    EXPECT_FALSE(budget.HealAvailable());
    EXPECT_TRUE(budget.PoisonAvailable());
    EXPECT_EQ(v.inbox["frank"]->Count(MessageKind::Save), 1u);
    EXPECT_EQ(v.inbox["frank"]->Count(MessageKind::Poison), 0u);
}

TEST(NightPipeline, PoisonOfferedOnceHealIsSpent)
{
    Village v;
    v.Night("yes", "Poison dave please");

    AbilityBudget budget;
    budget.ConsumeHeal();

    NightPipeline night(v.roster, v.fanout, v.rng, "moderator");
    NightReport const report = night.Run(budget);

    EXPECT_EQ(v.inbox["frank"]->Count(MessageKind::Save), 0u);
    EXPECT_EQ(v.inbox["frank"]->Count(MessageKind::Poison), 1u);
    EXPECT_TRUE(report.poison_used);
    EXPECT_EQ(report.Pending(), (std::vector<Identity>{"carol", "dave"}));
    EXPECT_FALSE(budget.PoisonAvailable());

    // both potions gone: the witch is not asked again
    NightPipeline next(v.roster, v.fanout, v.rng, "moderator");
    next.Run(budget);
    EXPECT_EQ(v.inbox["frank"]->Count(MessageKind::Poison), 1u);
}

TEST(NightPipeline, JunkWolfBallotDoesNotBlockTheKill)
{
    Village v;
    v.Script("alice", {{MessageKind::NightKill, "nobody"}});
    v.Script("bob", {{MessageKind::NightKill, "dave"}});
    v.Script("erin", {});
    v.Script("frank", {{MessageKind::Save, "no"}, {MessageKind::Poison, "no"}});

    AbilityBudget budget;
    NightPipeline night(v.roster, v.fanout, v.rng, "moderator");
    NightReport const report = night.Run(budget);

    EXPECT_EQ(report.most_voted, std::optional<std::string>{"dave"});
    EXPECT_EQ(report.Pending(), (std::vector<Identity>{"dave"}));
}

TEST(NightPipeline, NoVotesNoKill)
{
    Village v;
    v.Script("alice", {});
    v.Script("bob", {});
    v.Script("erin", {});
    v.Script("frank", {{MessageKind::Save, "no"}, {MessageKind::Poison, "no"}});

    AbilityBudget budget;
    NightPipeline night(v.roster, v.fanout, v.rng, "moderator");
    NightReport const report = night.Run(budget);

    EXPECT_EQ(report.most_voted, std::nullopt);
    EXPECT_TRUE(report.Pending().empty());
    EXPECT_FALSE(report.investigation.has_value());
}

TEST(DayPipeline, MajorityIsVotedOut)
{
    Village v;
    v.roster.MarkDead("carol");

    v.Script("alice", {{MessageKind::DayVote, "dave"}, {MessageKind::DayDiscuss, "I am a villager."}});
    v.Script("bob", {{MessageKind::DayVote, "dave"}});
    v.Script("dave", {{MessageKind::DayVote, "alice"}});
    v.Script("erin", {{MessageKind::DayVote, "alice is the wolf"}});
    v.Script("frank", {{MessageKind::DayVote, "Dave"}});
    v.Script("carol", {{MessageKind::DayVote, "alice"}}); // dead, never asked

    DayPipeline day(v.roster, v.fanout, v.rng, "moderator");
    DayReport const report = day.Run({"carol"});

    EXPECT_EQ(report.voted_out, std::optional<Identity>{"dave"});
    EXPECT_EQ(report.ballots, 5u);
    EXPECT_EQ(report.speeches.size(), 5u);
    EXPECT_TRUE(v.inbox["carol"]->Snapshot().empty());

    std::vector<std::string> const heard = Contents(v.inbox["bob"]->Snapshot(), MessageKind::SystemNotice);
    ASSERT_FALSE(heard.empty());
    EXPECT_NE(heard.front().find("has been eliminated: carol"), std::string::npos);
    EXPECT_EQ(heard.back(), "The voting result is: Player dave has been eliminated.");
    // alice's speech is relayed to everyone
    EXPECT_NE(std::ranges::find(heard, "I am a villager."), heard.end());
}

TEST(DayPipeline, BallotsNamingNobodyAreDropped)
{
    Village v;
    v.Script("alice", {{MessageKind::DayVote, "skip"}});
    v.Script("bob", {{MessageKind::DayVote, "skip"}});
    v.Script("carol", {{MessageKind::DayVote, "alice"}});
    v.Script("dave", {});
    v.Script("erin", {});
    v.Script("frank", {});

    DayPipeline day(v.roster, v.fanout, v.rng, "moderator");
    DayReport const report = day.Run({});

    EXPECT_EQ(report.voted_out, std::optional<Identity>{"alice"});
    EXPECT_EQ(report.ballots, 1u);
}

TEST(DayPipeline, VotesForTheDeadDoNotOutweighTheLiving)
{
    Village v;
    v.roster.MarkDead("carol");
    v.Script("alice", {{MessageKind::DayVote, "carol"}});
    v.Script("bob", {{MessageKind::DayVote, "carol"}});
    v.Script("dave", {{MessageKind::DayVote, "erin"}});
    v.Script("erin", {});
    v.Script("frank", {});

    DayPipeline day(v.roster, v.fanout, v.rng, "moderator");
    DayReport const report = day.Run({"carol"});

    EXPECT_EQ(report.voted_out, std::optional<Identity>{"erin"});
    EXPECT_EQ(report.ballots, 1u);
}

TEST(DayPipeline, PeacefulNightAndNoBallots)
{
    Village v;
    for (Identity const& id : {"alice", "bob", "carol", "dave", "erin", "frank"})
    {
        v.Script(id, {});
    }

    DayPipeline day(v.roster, v.fanout, v.rng, "moderator");
    DayReport const report = day.Run({});

    EXPECT_EQ(report.voted_out, std::nullopt);
    std::vector<std::string> const heard = Contents(v.inbox["erin"]->Snapshot(), MessageKind::SystemNotice);
    ASSERT_FALSE(heard.empty());
    EXPECT_NE(heard.front().find("Last night is peaceful"), std::string::npos);
}
