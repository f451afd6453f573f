#include <gtest/gtest.h>

#include <chrono>
#include <format>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <string_view>
#include <variant>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include "../auth/Auth.hpp"
#include "../core/Exception.hpp"
#include "../core/RandomBot.hpp"
#include "../net/WsTransport.hpp"

using namespace lupus::core;
using namespace std::chrono_literals;

namespace
{
using WsClient = websocketpp::client<websocketpp::config::asio_client>;

// Minimal participant: says hello, reports the welcome, answers requests with a RandomBot.
class LoopbackClient
{
public:
    LoopbackClient(std::string url, net::HelloFrame hello) :
        bot_(hello.identity, 1),
        hello_(std::move(hello))
    {
        c_.clear_access_channels(websocketpp::log::alevel::all);
        c_.clear_error_channels(websocketpp::log::elevel::all);
        c_.init_asio();

        c_.set_open_handler([this](websocketpp::connection_hdl hdl)
        {
            hdl_ = hdl;
            Send(hdl, net::BuildHello(hello_));
        });
        c_.set_message_handler([this](websocketpp::connection_hdl hdl, WsClient::message_ptr msg)
        {
            std::string const& pl = msg->get_payload();
            auto frame = net::DecodeFrame({reinterpret_cast<std::byte const*>(pl.data()), pl.size()});
            if (!frame) return;

            if (auto const* w = std::get_if<net::WelcomeFrame>(&*frame))
            {
                welcome_.set_value(*w);
            }
            else if (auto const* r = std::get_if<net::RequestFrame>(&*frame))
            {
                Send(hdl, net::BuildReply(r->request_id, bot_.Handle(r->msg)));
            }
        });

        websocketpp::lib::error_code ec;
        WsClient::connection_ptr con = c_.get_connection(url, ec);
        EXPECT_FALSE(ec) << ec.message();
        if (!ec) c_.connect(con);
        thr_ = std::thread([this] { c_.run(); });
    }

    ~LoopbackClient()
    {
        c_.stop();
        if (thr_.joinable()) thr_.join();
    }

    auto Welcome() -> std::future<net::WelcomeFrame> { return welcome_.get_future(); }

    // Call after the welcome arrived.
    auto Close() -> void
    {
        websocketpp::lib::error_code ec;
        c_.close(hdl_, websocketpp::close::status::normal, "bye", ec);
    }

private:
    auto Send(websocketpp::connection_hdl hdl, flatbuffers::DetachedBuffer const& buf) -> void
    {
        websocketpp::lib::error_code ec;
        c_.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
    }

    WsClient c_;
    RandomBot bot_;
    net::HelloFrame hello_;
    websocketpp::connection_hdl hdl_;
    std::promise<net::WelcomeFrame> welcome_;
    std::thread thr_;
};

auto AcceptAll() -> net::WsTransport::JoinHandler
{
    return [](JoinRequest req) -> std::future<JoinResult>
    {
        std::promise<JoinResult> p;
        if (req.identity == "taken")
        {
            p.set_value(JoinResult{JoinStatus::Full, std::nullopt, "game is full"});
        }
        else
        {
            p.set_value(JoinResult{JoinStatus::Accepted, Role::Villager, {}});
        }
        return p.get_future();
    };
}

// Lets every agent in; signatures always check out.
class OpenChain final : public auth::ChainClient
{
public:
    auto HasAuth(std::string_view, std::string_view) const -> bool override { return true; }
    auto GetAgent(std::string_view) const -> std::string override { return "0x0"; }
    auto ValidSignature(std::string_view, std::string_view, std::string_view) const -> bool override { return true; }
};

auto NowSeconds() -> std::string
{
    auto const now = std::chrono::system_clock::now().time_since_epoch();
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

auto WaitDisconnected(net::WsTransport const& transport) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + 3s;
    while (transport.ConnectedCount() != 0)
    {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

auto Await(std::future<net::WelcomeFrame>& f) -> net::WelcomeFrame
{
    if (f.wait_for(3s) != std::future_status::ready)
    {
        ADD_FAILURE() << "no welcome within 3s";
        return {};
    }
    return f.get();
}
} // anonymous namespace

TEST(WsTransport, HelloWelcomeAndRoundTrip)
{
    constexpr std::uint16_t port = 19517;
    net::WsTransport transport(port, "s1");
    transport.OnJoin(AcceptAll());
    transport.Start();

    std::string const url = std::format("ws://127.0.0.1:{}", port);

    LoopbackClient alice(url, {"alice", "s1", "0", "sig"});
    auto welcome = alice.Welcome();
    ASSERT_EQ(welcome.wait_for(3s), std::future_status::ready);
    net::WelcomeFrame const joined = welcome.get();
    EXPECT_TRUE(joined.result.Accepted());
    EXPECT_EQ(joined.result.role, std::optional<Role>{Role::Villager});
    EXPECT_FALSE(joined.resume_token.empty());

    Message const prompt{MessageKind::DayVote, "moderator", "It's time to vote."};
    Message const reply = transport.Send(prompt, "Alice", "moderator", std::chrono::steady_clock::now() + 2s);
    EXPECT_EQ(reply.kind, MessageKind::Response);
    EXPECT_EQ(reply.source, "alice");

    // a second connection cannot take the same identity
    LoopbackClient twin(url, {"ALICE", "s1", "0", "sig"});
    auto dup = twin.Welcome();
    ASSERT_EQ(dup.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(dup.get().result.status, JoinStatus::Duplicate);

    LoopbackClient stranger(url, {"bob", "other-session", "0", "sig"});
    auto refused = stranger.Welcome();
    ASSERT_EQ(refused.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(refused.get().result.status, JoinStatus::Unauthorized);

    LoopbackClient late(url, {"taken", "s1", "0", "sig"});
    auto full = late.Welcome();
    ASSERT_EQ(full.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(full.get().result.status, JoinStatus::Full);
    EXPECT_THROW(transport.Send(prompt, "taken", "moderator", std::chrono::steady_clock::now() + 500ms),
                 error::DeliveryError);

    EXPECT_THROW(transport.Send(prompt, "ghost", "moderator", std::chrono::steady_clock::now() + 500ms),
                 error::DeliveryError);

    transport.Stop();
}

TEST(WsTransport, HostedAgentsStayLocal)
{
    net::WsTransport transport(19518, "s1");
    transport.Register("moderator", []
    {
        auto d = std::make_unique<Dispatcher>("moderator");
        d->On(MessageKind::Register, [](Message const&) { return MakeResponse("moderator", "villager"); });
        return d;
    });

    Message const reg{MessageKind::Register, "zed", "join werewolf game"};
    EXPECT_EQ(transport.Send(reg, "moderator", "zed", std::chrono::steady_clock::now() + 1s).content, "villager");
    EXPECT_THROW(transport.Send(reg, "nobody", "zed", std::chrono::steady_clock::now() + 200ms), error::DeliveryError);
}

TEST(WsTransport, EmptySessionIsAConfigError)
{
    EXPECT_THROW(net::WsTransport(19519, ""), error::ConfigError);
}

TEST(WsTransport, DroppedSeatNeedsItsResumeToken)
{
    constexpr std::uint16_t port = 19520;
    net::WsTransport transport(port, "s1");
    transport.OnJoin(AcceptAll());
    transport.Start();
    std::string const url = std::format("ws://127.0.0.1:{}", port);

    std::string token;
    {
        LoopbackClient alice(url, {"alice", "s1", "0", "sig"});
        auto welcome = alice.Welcome();
        net::WelcomeFrame const joined = Await(welcome);
        ASSERT_TRUE(joined.result.Accepted());
        token = joined.resume_token;
        alice.Close();
        ASSERT_TRUE(WaitDisconnected(transport));
    }

    LoopbackClient impostor(url, {"alice", "s1", "0", "sig"});
    auto stolen = impostor.Welcome();
    net::WelcomeFrame const refused = Await(stolen);
    EXPECT_EQ(refused.result.status, JoinStatus::Unauthorized);
    EXPECT_FALSE(refused.result.role.has_value());
    EXPECT_TRUE(refused.resume_token.empty());

    LoopbackClient guesser(url, {"alice", "s1", "0", "sig", "0000"});
    auto guessed = guesser.Welcome();
    EXPECT_EQ(Await(guessed).result.status, JoinStatus::Unauthorized);

    LoopbackClient back(url, {"Alice", "s1", "0", "sig", token});
    auto resumed = back.Welcome();
    net::WelcomeFrame const again = Await(resumed);
    EXPECT_TRUE(again.result.Accepted());
    EXPECT_EQ(again.result.role, std::optional<Role>{Role::Villager});
    EXPECT_EQ(again.resume_token, token);

    Message const prompt{MessageKind::DayVote, "moderator", "It's time to vote."};
    EXPECT_EQ(transport.Send(prompt, "alice", "moderator", std::chrono::steady_clock::now() + 2s).kind,
              MessageKind::Response);

    transport.Stop();
}

TEST(WsTransport, GateVetsReconnects)
{
    constexpr std::uint16_t port = 19521;
    auto gate = std::make_shared<auth::Gate const>(std::make_shared<OpenChain const>(), "s1");
    net::WsTransport transport(port, "s1", gate);
    transport.OnJoin(AcceptAll());
    transport.Start();
    std::string const url = std::format("ws://127.0.0.1:{}", port);

    std::string token;
    {
        LoopbackClient bob(url, {"bob", "s1", NowSeconds(), "sig"});
        auto welcome = bob.Welcome();
        net::WelcomeFrame const joined = Await(welcome);
        ASSERT_TRUE(joined.result.Accepted());
        token = joined.resume_token;
        bob.Close();
        ASSERT_TRUE(WaitDisconnected(transport));
    }

    // right token, expired credentials
    LoopbackClient stale(url, {"bob", "s1", "1", "sig", token});
    auto expired = stale.Welcome();
    EXPECT_EQ(Await(expired).result.status, JoinStatus::Unauthorized);

    LoopbackClient fresh(url, {"bob", "s1", NowSeconds(), "sig", token});
    auto resumed = fresh.Welcome();
    EXPECT_TRUE(Await(resumed).result.Accepted());

    transport.Stop();
}
