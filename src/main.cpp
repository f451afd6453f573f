//
// main.cpp: local self-play: RandomBots against the engine over LocalTransport
//

#include <charconv>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <print>
#include <string>
#include <thread>
#include <vector>

#include "auth/Auth.hpp"
#include "core/Exception.hpp"
#include "core/GameEngine.hpp"
#include "core/LocalTransport.hpp"
#include "core/RandomBot.hpp"
#include "core/Types.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"
#include "debug/RecordingParticipant.hpp"

namespace
{
    struct SelfPlayConfig
    {
        lupus::core::Config game{};
        std::string log_path{"selfplay.log"};
    };

    auto ParseArgs(int argc, char** argv) -> SelfPlayConfig
    {
        using lupus::core::error::Code;

        SelfPlayConfig sp{};
        sp.game.seed = 123456789ULL;
        sp.game.registration_timeout = std::chrono::seconds(10);
        sp.game.registration_poll = std::chrono::seconds(1);
        sp.game.send_timeout = std::chrono::seconds(5);

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--concurrent")
            {
                sp.game.fanout_mode = lupus::core::FanoutMode::Concurrent;
                continue;
            }
            if (i + 1 >= argc)
            {
                LPS_THROW(Code::Config, std::format("{} needs a value", arg));
            }
            std::string const v = argv[++i];

            auto as_uint = [&]() -> std::uint64_t
            {
                std::uint64_t out{};
                auto res = std::from_chars(v.data(), v.data() + v.size(), out);
                if (res.ec != std::errc{} || res.ptr != v.data() + v.size())
                {
                    LPS_THROW(Code::Config, std::format("{} expects a number, got '{}'", arg, v));
                }
                return out;
            };

            if (arg == "--seed") { sp.game.seed = as_uint(); }
            else if (arg == "--rounds") { sp.game.max_rounds = static_cast<std::uint32_t>(as_uint()); }
            else if (arg == "--roles") { sp.game.roles = lupus::core::ParseRoleTable(v); }
            else if (arg == "--log") { sp.log_path = v; }
            else
            {
                std::print("[SelfPlay] ignoring unknown argument '{}'\n", arg);
            }
        }
        return sp;
    }
}

int main(int argc, char** argv)
{
    using namespace lupus::core;

    SelfPlayConfig sp{};
    try
    {
        sp = ParseArgs(argc, argv);
    }
    catch (error::ConfigError const& e)
    {
        std::print(stderr, "[SelfPlay] configuration error: {}\n", e.what());
        return 1;
    }

    Identity const moderator = "moderator";
    auto transport = std::make_shared<LocalTransport>();
    auto exchanges = std::make_shared<debug::ExchangeLog>();

    GameEngine engine(sp.game, transport, moderator);

    uint32_t const n_players = TotalSlots(sp.game.roles);
    std::vector<std::jthread> joiners;
    joiners.reserve(n_players);

    for (uint32_t i = 0; i < n_players; ++i)
    {
        Identity const id = std::format("player_{}", i + 1);
        uint64_t const seed = sp.game.seed + static_cast<uint64_t>(i) * 1337u;

        transport->Register(id, debug::WrapRecording([id, seed]
        {
            return std::make_unique<RandomBot>(id, seed);
        }, exchanges));

        joiners.emplace_back([transport, moderator, id, &sp]
        {
            auth::Credentials const creds{id, "0", "unsigned"};
            Message const reg{MessageKind::Register, id, auth::EncodeCredentials(creds)};
            try
            {
                Message const reply = transport->Send(reg, moderator, id,
                                                      std::chrono::steady_clock::now() + sp.game.registration_timeout);
                std::print("[SelfPlay] {} -> {}\n", id, reply.content.empty() ? "rejected" : reply.content);
            }
            catch (error::DeliveryError const& e)
            {
                std::print("[SelfPlay] {} could not register: {}\n", id, e.what());
            }
        });
    }

    GameSummary const summary = engine.Run();
    joiners.clear();

    debug::CheckInvariants(engine.RosterView());
    debug::CheckInvariants(summary, engine.RosterView());

    debug::AuditLogger audit(sp.log_path);
    audit.start(sp.game, engine.RosterView());
    for (RoundRecord const& r : summary.rounds)
    {
        audit.round(r);
    }
    audit.end(summary, engine.RosterView());
    audit.flush();

    std::print("[SelfPlay] {} after {} round(s), {} exchanges, log at {}\n",
               ToString(summary.outcome), summary.rounds_played, exchanges->All().size(), sp.log_path);

    return summary.outcome == Outcome::Aborted ? 2 : 0;
}
