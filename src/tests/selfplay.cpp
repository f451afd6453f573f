#include <gtest/gtest.h>
#include <filesystem>
#include <format>
#include <print>
#include <thread>

#include "../core/GameEngine.hpp"
#include "../core/LocalTransport.hpp"
#include "../core/RandomBot.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingParticipant.hpp"

using namespace lupus::core;
using namespace std::chrono_literals;

namespace
{
struct SelfPlay
{
    std::shared_ptr<LocalTransport> transport = std::make_shared<LocalTransport>();
    std::shared_ptr<debug::ExchangeLog> log = std::make_shared<debug::ExchangeLog>();
    Config cfg;
    GameEngine engine;

    SelfPlay(std::uint64_t seed, FanoutMode mode) :
        cfg{make_config(seed, mode)},
        engine(cfg, transport, "moderator")
    {
    }

    static auto make_config(std::uint64_t seed, FanoutMode mode) -> Config
    {
        Config c{};
        c.seed = seed;
        c.max_rounds = 4;
        c.fanout_mode = mode;
        c.registration_timeout = 5s;
        c.registration_poll = 100ms;
        c.send_timeout = 2s;
        return c;
    }

    auto run() -> GameSummary
    {
        std::vector<std::jthread> joiners;
        for (uint32_t i = 0; i < TotalSlots(cfg.roles); ++i)
        {
            Identity const id = std::format("bot{}", i + 1);
            transport->Register(id, debug::WrapRecording([id, seed = cfg.seed + i]
            {
                return std::make_unique<RandomBot>(id, seed);
            }, log));

            joiners.emplace_back([this, id]
            {
                Message const reg{MessageKind::Register, id, "join werewolf game"};
                Message const reply = transport->Send(reg, "moderator", id, std::chrono::steady_clock::now() + 5s);
                EXPECT_FALSE(reply.content.empty()) << id << " was not seated";
            });
        }
        return engine.Run();
    }
};
} // anonymous namespace

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    try
    {
        for (auto const [seed, mode] : {std::pair{111ull, FanoutMode::Sequential},
                                        std::pair{222ull, FanoutMode::Sequential},
                                        std::pair{333ull, FanoutMode::Concurrent}})
        {
            SelfPlay game(seed, mode);
            GameSummary const summary = game.run();

            ASSERT_NE(summary.outcome, Outcome::Aborted) << "seed " << seed;
            EXPECT_EQ(game.engine.PhaseNow(), Phase::Terminal);
            EXPECT_LE(summary.rounds_played, game.cfg.max_rounds);

            debug::CheckInvariants(game.engine.RosterView());
            debug::CheckInvariants(summary, game.engine.RosterView());

            // only the two wolves hear who the wolves are
            EXPECT_EQ(game.log->Count(MessageKind::ImportantInfo), 2u);
            EXPECT_GT(game.log->Count(MessageKind::NightKill), 0u);

            {
                debug::AuditLogger audit(std::format("_artifacts/game_{}.log", seed));
                audit.start(game.cfg, game.engine.RosterView());
                for (RoundRecord const& r : summary.rounds)
                {
                    audit.round(r);
                }
                audit.end(summary, game.engine.RosterView());
                ASSERT_TRUE(audit.good());
            }

            auto const path = fs::path(std::format("_artifacts/game_{}.log", seed));
            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        FAIL() << e.what();
    }
}
