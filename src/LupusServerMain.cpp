//
// LupusServerMain.cpp: moderator server: WebSocket++ transport + GameEngine
//
// Waits for every role slot to be claimed by a remote participant (Hello frames),
// then runs the game to completion and exits with the outcome.

#include <chrono>
#include <cstdint>
#include <format>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <thread>

#include "core/Exception.hpp"
#include "core/GameEngine.hpp"
#include "core/Types.hpp"
#include "core/Util.hpp"
#include "net/WsTransport.hpp"

namespace
{
    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::string session;
        lupus::core::Identity moderator{"moderator"};
        lupus::core::Config game{};
    };

    template <class T>
    auto NumberArg(std::string const& flag, std::string const& text) -> T
    {
        std::optional<T> const n = lupus::core::util::ParseNumber<T>(text);
        if (!n)
        {
            LPS_THROW(lupus::core::error::Code::Config,
                      std::format("{} expects a number in [{}, {}], got '{}'",
                                  flag, std::numeric_limits<T>::min(), std::numeric_limits<T>::max(), text));
        }
        return *n;
    }

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        using lupus::core::error::Code;

        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_str = [&]() -> std::string
            {
                if (i + 1 >= argc)
                {
                    LPS_THROW(Code::Config, std::format("{} needs a value", arg));
                }
                return argv[++i];
            };
            auto next_uint = [&]() -> std::uint64_t
            {
                return NumberArg<std::uint64_t>(arg, next_str());
            };

            if (arg == "--port") { cfg.port = NumberArg<std::uint16_t>(arg, next_str()); }
            else if (arg == "--session") { cfg.session = next_str(); }
            else if (arg == "--moderator") { cfg.moderator = next_str(); }
            else if (arg == "--roles") { cfg.game.roles = lupus::core::ParseRoleTable(next_str()); }
            else if (arg == "--rounds") { cfg.game.max_rounds = NumberArg<std::uint32_t>(arg, next_str()); }
            else if (arg == "--seed") { cfg.game.seed = next_uint(); }
            else if (arg == "--timeout_ms") { cfg.game.send_timeout = std::chrono::milliseconds(next_uint()); }
            else if (arg == "--registration_s") { cfg.game.registration_timeout = std::chrono::seconds(next_uint()); }
            else if (arg == "--poll_s") { cfg.game.registration_poll = std::chrono::seconds(next_uint()); }
            else if (arg == "--concurrent") { cfg.game.fanout_mode = lupus::core::FanoutMode::Concurrent; }
            else
            {
                std::print("[Server] ignoring unknown argument '{}'\n", arg);
            }
        }

        if (cfg.session.empty())
        {
            if (char const* env = std::getenv("LUPUS_SESSION_ID"); env != nullptr)
            {
                cfg.session = lupus::core::util::Trim(env);
            }
        }
        if (cfg.session.empty())
        {
            LPS_THROW(Code::Config, "session id not set (use --session or LUPUS_SESSION_ID)");
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace lupus::core;

    ServerConfig sc{};
    std::shared_ptr<net::WsTransport> transport;
    std::unique_ptr<GameEngine> engine;
    try
    {
        sc = ParseArgs(argc, argv);
        transport = std::make_shared<net::WsTransport>(sc.port, sc.session);
        engine = std::make_unique<GameEngine>(sc.game, transport, sc.moderator);
    }
    catch (error::ConfigError const& e)
    {
        std::print(stderr, "[Server] configuration error: {}\n", e.what());
        return 1;
    }

    std::print("[Server] session {} | {} slots | seed {}\n",
               sc.session, TotalSlots(sc.game.roles), sc.game.seed);

    transport->OnJoin([&engine](JoinRequest req)
    {
        return engine->Join(std::move(req));
    });
    transport->Start();

    GameSummary const summary = engine->Run();

    for (Elimination const& e : summary.eliminations)
    {
        std::print("[Server] {} died in {} {}\n", e.identity, ToString(e.phase), e.round);
    }
    std::print("[Server] {} after {} round(s)\n", ToString(summary.outcome), summary.rounds_played);

    // Keep server up a moment to flush frames
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    transport->Stop();

    return summary.outcome == Outcome::Aborted ? 2 : 0;
}
