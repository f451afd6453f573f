//
// NetBotClientMain.cpp: headless participant that plays via RandomBot
//
// Connects to the server, sends Hello with its identity and credentials,
// then answers every Request frame with a Reply.

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <cstdlib>
#include <memory>
#include <print>
#include <span>
#include <string>
#include <variant>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Exception.hpp"
#include "core/RandomBot.hpp"
#include "core/Types.hpp"
#include "net/Codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string url{"ws://127.0.0.1:9002"};
        std::string id;
        std::string session;
        std::string timestamp; // defaults to now
        std::string signature{"unsigned"};
        std::uint64_t seed{424242ULL};
    };

    auto ParseArgs(int argc, char** argv) -> CmdLine
    {
        using lupus::core::error::Code;

        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string k = argv[i];
            if (i + 1 >= argc)
            {
                LPS_THROW(Code::Config, std::format("{} needs a value", k));
            }
            std::string v = argv[++i];

            if (k == "--url") { c.url = std::move(v); }
            else if (k == "--id") { c.id = std::move(v); }
            else if (k == "--session") { c.session = std::move(v); }
            else if (k == "--timestamp") { c.timestamp = std::move(v); }
            else if (k == "--signature") { c.signature = std::move(v); }
            else if (k == "--seed")
            {
                auto res = std::from_chars(v.data(), v.data() + v.size(), c.seed);
                if (res.ec != std::errc{})
                {
                    LPS_THROW(Code::Config, std::format("--seed expects a number, got '{}'", v));
                }
            }
        }

        if (c.session.empty())
        {
            if (char const* env = std::getenv("LUPUS_SESSION_ID"); env != nullptr) c.session = env;
        }
        if (c.id.empty() || c.session.empty())
        {
            LPS_THROW(Code::Config, "--id and --session (or LUPUS_SESSION_ID) are required");
        }
        if (c.timestamp.empty())
        {
            auto const now = std::chrono::system_clock::now().time_since_epoch();
            c.timestamp = std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
        }
        return c;
    }

    auto Send(WsClient& c, websocketpp::connection_hdl const& hdl, flatbuffers::DetachedBuffer const& buf) -> bool
    {
        websocketpp::lib::error_code ec;
        c.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[Bot] send() failed: {}\n", ec.message());
        }
        return !ec;
    }
} // anon

int main(int argc, char** argv)
{
    using namespace lupus::core;

    CmdLine cfg{};
    try
    {
        cfg = ParseArgs(argc, argv);
    }
    catch (error::ConfigError const& e)
    {
        std::print(stderr, "[Bot] configuration error: {}\n", e.what());
        return 1;
    }
    std::print("[Bot] {} connecting to {} | seed={}\n", cfg.id, cfg.url, cfg.seed);

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.init_asio();

    RandomBot bot(cfg.id, cfg.seed);
    std::atomic<int> exit_code{0};

    c.set_open_handler([&](websocketpp::connection_hdl hdl)
    {
        std::print("[Bot] Connected, sending hello\n");
        Send(c, hdl, net::BuildHello(net::HelloFrame{cfg.id, cfg.session, cfg.timestamp, cfg.signature}));
    });

    c.set_message_handler([&](websocketpp::connection_hdl hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Bot] Ignoring non-binary frame\n");
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(pl.data()), pl.size()};

        std::expected<net::Frame, net::ParseError> frame = net::DecodeFrame(bytes);
        if (!frame.has_value())
        {
            std::print("[Bot] Bad frame: {}\n", frame.error().message);
            return;
        }

        if (auto const* welcome = std::get_if<net::WelcomeFrame>(&*frame))
        {
            JoinResult const& res = welcome->result;
            if (!res.Accepted())
            {
                std::print("[Bot] Join {}: {}\n", ToString(res.status), res.detail);
                exit_code = 3;
                websocketpp::lib::error_code ec;
                c.close(hdl, websocketpp::close::status::normal, "join refused", ec);
                return;
            }
            bot.SetRole(res.role);
            std::print("[Bot] Joined as {}\n", res.role ? ToString(*res.role) : std::string_view{"?"});
        }
        else if (auto const* req = std::get_if<net::RequestFrame>(&*frame))
        {
            Message const reply = bot.Handle(req->msg);
            if (req->msg.kind != MessageKind::SystemNotice)
            {
                std::print("[Bot] {} -> '{}'\n", ToString(req->msg.kind), reply.content);
            }
            Send(c, hdl, net::BuildReply(req->request_id, reply));
        }
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[Bot] Closed by server.\n");
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(cfg.url, ec);
    if (ec)
    {
        std::print("[Bot] get_connection error: {}\n", ec.message());
        return 2;
    }

    c.connect(con);

    // Run the client loop (blocking)
    c.run();

    return exit_code.load();
}
