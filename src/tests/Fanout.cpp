#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../core/Fanout.hpp"
#include "../core/LocalTransport.hpp"
#include "../core/Messenger.hpp"
#include "../core/Roster.hpp"
#include "TestAgents.hpp"

using namespace lupus::core;
using namespace std::chrono_literals;

namespace
{
struct Table
{
    std::shared_ptr<LocalTransport> transport = std::make_shared<LocalTransport>();
    lupus::test::FixedRandom rng;
    Roster roster{RoleTable{{Role::Wolf, 2}, {Role::Villager, 2}}, rng};
    Messenger messenger{transport, "moderator", 150ms};

    Table()
    {
        lupus::test::Fill(roster, {"w1", "w2", "v1", "v2"});
    }

    auto Echo(Identity const& id, std::chrono::milliseconds delay = 0ms) -> std::shared_ptr<lupus::test::ScriptedAgent::Inbox>
    {
        return lupus::test::RegisterScripted(*transport, id, {{MessageKind::DayVote, "vote from " + id}}, delay);
    }
};

auto Sources(std::vector<Message> const& replies) -> std::vector<Identity>
{
    std::vector<Identity> out;
    for (Message const& m : replies) out.push_back(m.source);
    return out;
}

Message const kVote{MessageKind::DayVote, "moderator", "It's time to vote."};
} // anonymous namespace

TEST(Fanout, RepliesComeBackInRosterOrder)
{
    for (FanoutMode const mode : {FanoutMode::Sequential, FanoutMode::Concurrent})
    {
        Table t;
        // the first seat answers last
        t.Echo("w1", 60ms);
        t.Echo("w2");
        t.Echo("v1");
        t.Echo("v2");

        Fanout f(t.roster, t.messenger, mode);
        std::vector<Message> const replies = f.Collect(kVote, RoleFilter::Any());

        EXPECT_EQ(Sources(replies), (std::vector<Identity>{"w1", "w2", "v1", "v2"}));
        EXPECT_EQ(replies.front().content, "vote from w1");
    }
}

TEST(Fanout, UnreachableParticipantIsLeftOut)
{
    for (FanoutMode const mode : {FanoutMode::Sequential, FanoutMode::Concurrent})
    {
        Table t;
        t.Echo("w1");
        t.Echo("v1");
        t.Echo("v2");
        // w2 is seated but never registered with the transport

        Fanout f(t.roster, t.messenger, mode);
        EXPECT_EQ(Sources(f.Collect(kVote, RoleFilter::Any())), (std::vector<Identity>{"w1", "v1", "v2"}));
        EXPECT_EQ(f.Ask(kVote, "w2"), std::nullopt);
    }
}

TEST(Fanout, SlowParticipantMissesTheDeadline)
{
    for (FanoutMode const mode : {FanoutMode::Sequential, FanoutMode::Concurrent})
    {
        Table t;
        t.Echo("w1");
        t.Echo("w2", 500ms);
        t.Echo("v1");
        t.Echo("v2");

        Fanout f(t.roster, t.messenger, mode);
        auto const start = std::chrono::steady_clock::now();
        std::vector<Message> const replies = f.Collect(kVote, RoleFilter::Any());
        auto const took = std::chrono::steady_clock::now() - start;

        EXPECT_EQ(Sources(replies), (std::vector<Identity>{"w1", "v1", "v2"}));
        EXPECT_LT(took, 450ms);
    }
}

TEST(Fanout, RoleFilterAndDeadSeats)
{
    Table t;
    auto const w1 = t.Echo("w1");
    auto const w2 = t.Echo("w2");
    auto const v1 = t.Echo("v1");
    auto const v2 = t.Echo("v2");
    t.roster.MarkDead("w2");

    Fanout f(t.roster, t.messenger, FanoutMode::Sequential);
    EXPECT_EQ(f.Broadcast(kVote, RoleFilter::Only(Role::Wolf)), 1u);
    EXPECT_EQ(w1->Count(MessageKind::DayVote), 1u);
    EXPECT_EQ(w2->Count(MessageKind::DayVote), 0u);
    EXPECT_EQ(v1->Count(MessageKind::DayVote), 0u);

    EXPECT_EQ(f.Broadcast(kVote, RoleFilter::Any()), 3u);
    EXPECT_EQ(v2->Count(MessageKind::DayVote), 1u);
}

TEST(Messenger, SpoofedReplyIsMalformed)
{
    auto transport = std::make_shared<LocalTransport>();
    // answers on behalf of someone else
    transport->Register("liar", []
    {
        auto d = std::make_unique<Dispatcher>("liar");
        d->On(MessageKind::DayVote, [](Message const&) { return MakeResponse("honest", "x"); });
        return d;
    });

    Messenger m(transport, "moderator", 200ms);
    DeliveryResult const res = m.Send(kVote, "liar");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().reason, DeliveryReason::Malformed);

    DeliveryResult const missing = m.Send(kVote, "ghost");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().reason, DeliveryReason::Unreachable);
}
