//
// GameEngine.cpp
//

#include "GameEngine.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <utility>

#include "Agent.hpp"
#include "Exception.hpp"
#include "Util.hpp"
#include "WinEvaluator.hpp"

namespace lupus::core
{
    namespace
    {
        auto ToOutcome(Winner const w) -> std::optional<Outcome>
        {
            switch (w)
            {
            case Winner::Wolves: return Outcome::WolvesWin;
            case Winner::Village: return Outcome::VillageWin;
            case Winner::None: return std::nullopt;
            }
            return std::nullopt;
        }

        auto MakeModeratorAgent(Identity self, std::shared_ptr<Lobby> lobby) -> std::unique_ptr<Agent>
        {
            auto agent = std::make_unique<Dispatcher>(self);
            agent->On(MessageKind::Register, [self, lobby](Message const& msg) -> Message
            {
                JoinRequest req{msg.source, auth::DecodeCredentials(msg.content)};
                if (req.credentials.agent.empty()) req.credentials.agent = msg.source;

                // resolved by the engine loop, or by Close() once the lobby is shut
                JoinResult const res = lobby->Submit(std::move(req)).get();
                return MakeResponse(self, res.role ? std::string{ToString(*res.role)} : std::string{});
            });
            return agent;
        }
    }

    GameEngine::GameEngine(Config const& config,
                           std::shared_ptr<Transport> transport,
                           Identity moderator,
                           std::shared_ptr<auth::Gate const> gate,
                           std::unique_ptr<RandomSource> rng) :
        cfg_(config),
        transport_(std::move(transport)),
        moderator_(std::move(moderator)),
        gate_(std::move(gate)),
        rng_(rng ? std::move(rng) : std::make_unique<SeededRandom>(cfg_.seed)),
        roster_(cfg_.roles, *rng_),
        lobby_(std::make_shared<Lobby>(gate_.get())),
        messenger_(transport_, moderator_, cfg_.send_timeout),
        fanout_(roster_, messenger_, cfg_.fanout_mode)
    {
        LPS_ASSERT(transport_ != nullptr, "GameEngine needs a transport");
        if (moderator_.empty())
        {
            LPS_THROW(error::Code::Config, "moderator identity must not be empty");
        }
        if (cfg_.max_rounds == 0)
        {
            LPS_THROW(error::Code::Config, "max_rounds must be at least 1");
        }

        transport_->Register(moderator_, [self = moderator_, lobby = lobby_]
        {
            return MakeModeratorAgent(self, lobby);
        });
    }

    auto GameEngine::Join(JoinRequest req) -> std::future<JoinResult>
    {
        return lobby_->Submit(std::move(req));
    }

    auto GameEngine::Run() -> GameSummary
    {
        if (std::exchange(started_, true))
        {
            LPS_THROW(error::Code::State, "GameEngine::Run called twice");
        }

        if (!RunLobby())
        {
            return Finish(Outcome::Aborted);
        }
        std::print("[Engine] All players registered, game starting...\n");

        RevealWolves();

        for (uint32_t round = 1; round <= cfg_.max_rounds; ++round)
        {
            summary_.rounds_played = round;

            RoundRecord record = RunNight(round);
            std::vector<Identity> night_deaths;
            for (Identity const& who : record.night.Pending())
            {
                if (auto dead = Eliminate(who, Phase::Night, round)) night_deaths.push_back(std::move(*dead));
            }

            if (auto const outcome = ToOutcome(EvaluateWinner(roster_)))
            {
                summary_.rounds.push_back(std::move(record));
                return Finish(*outcome);
            }

            RunDay(round, record, night_deaths);
            summary_.rounds.push_back(std::move(record));

            if (auto const outcome = ToOutcome(EvaluateWinner(roster_)))
            {
                return Finish(*outcome);
            }
        }

        return Finish(Outcome::NoWinner);
    }

    auto GameEngine::RunLobby() -> bool
    {
        using clock = std::chrono::steady_clock;
        auto const deadline = clock::now() + cfg_.registration_timeout;
        auto next_report = clock::now();

        lobby_->Drain(roster_);
        while (roster_.OpenSlots() > 0)
        {
            auto const now = clock::now();
            if (now >= deadline)
            {
                lobby_->Close();
                return false;
            }
            if (now >= next_report)
            {
                std::print("[Engine] Waiting for {} more players to register...\n", roster_.OpenSlots());
                next_report = now + cfg_.registration_poll;
            }

            lobby_->WaitUntil(std::min(next_report, deadline));
            lobby_->Drain(roster_);
        }

        // late joiners get Closed
        lobby_->Close();
        return true;
    }

    auto GameEngine::RevealWolves() -> void
    {
        std::string const wolves = util::Join(roster_.PeersOf(Role::Wolf), ", ");
        fanout_.Broadcast(Message{MessageKind::ImportantInfo, moderator_, "The wolves are: " + wolves},
                          RoleFilter::Only(Role::Wolf));
    }

    auto GameEngine::RunNight(uint32_t const round) -> RoundRecord
    {
        EnterPhase(Phase::Night);

        std::string const content = "New night comes. There are survive players: " +
            util::Join(roster_.Survivors(), ", ");
        std::print("[Engine] round {}: {}\n", round, content);
        fanout_.Broadcast(Message{MessageKind::SystemNotice, moderator_, content}, RoleFilter::Any());

        NightPipeline night(roster_, fanout_, *rng_, moderator_);
        return RoundRecord{round, night.Run(budget_), std::nullopt};
    }

    auto GameEngine::RunDay(uint32_t const round,
                            RoundRecord& record,
                            std::vector<Identity> const& night_deaths) -> void
    {
        EnterPhase(Phase::Day);

        DayPipeline day(roster_, fanout_, *rng_, moderator_);
        DayReport report = day.Run(night_deaths);
        if (report.voted_out)
        {
            Eliminate(*report.voted_out, Phase::Day, round);
        }
        record.day = std::move(report);
    }

    auto GameEngine::Eliminate(Identity const& who, Phase const phase, uint32_t const round) -> std::optional<Identity>
    {
        std::optional<Identity> dead = roster_.MarkDead(who);
        if (dead)
        {
            std::print("[Engine] {} eliminated ({} {})\n", *dead, ToString(phase), round);
            summary_.eliminations.push_back(Elimination{*dead, phase, round});
        }
        return dead;
    }

    auto GameEngine::Finish(Outcome const outcome) -> GameSummary
    {
        EnterPhase(Phase::Terminal);
        summary_.outcome = outcome;

        std::print("[Engine] {}\n", ToString(outcome));
        if (outcome != Outcome::Aborted)
        {
            fanout_.Broadcast(Message{MessageKind::SystemNotice, moderator_, std::string{ToString(outcome)}},
                              RoleFilter::Any());
        }
        return summary_;
    }

    auto GameEngine::EnterPhase(Phase const next) -> void
    {
        LPS_ASSERT(phase_ != Phase::Terminal, "no transitions out of Terminal");
        phase_ = next;
    }
}
