//
// GameEngine.hpp: owns the roster and drives Lobby -> Night -> Day -> Terminal
//

#ifndef LUPUS_GAMEENGINE_HPP
#define LUPUS_GAMEENGINE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "../auth/Auth.hpp"
#include "DayPipeline.hpp"
#include "Fanout.hpp"
#include "Lobby.hpp"
#include "Messenger.hpp"
#include "NightPipeline.hpp"
#include "Random.hpp"
#include "Roster.hpp"
#include "Transport.hpp"
#include "Types.hpp"

namespace lupus::core
{
    struct Elimination
    {
        Identity identity;
        Phase phase{Phase::Night};
        uint32_t round{};
    };

    struct RoundRecord
    {
        uint32_t round{};
        NightReport night;
        std::optional<DayReport> day; // empty if the game ended overnight
    };

    struct GameSummary
    {
        Outcome outcome{Outcome::Aborted};
        uint32_t rounds_played{};
        std::vector<Elimination> eliminations; // in order of death
        std::vector<RoundRecord> rounds;
    };

    class GameEngine
    {
    public:
        GameEngine() = delete;
        // Registers the moderator agent under `moderator` with the transport.
        GameEngine(Config const& config,
                   std::shared_ptr<Transport> transport,
                   Identity moderator,
                   std::shared_ptr<auth::Gate const> gate = nullptr,
                   std::unique_ptr<RandomSource> rng = nullptr);

        GameEngine(GameEngine const&) = delete;
        auto operator=(GameEngine const&) -> GameEngine& = delete;

        // Runs the whole game on the calling thread. May be called once.
        auto Run() -> GameSummary;

        // Thread-safe; usable before and during Run().
        auto Join(JoinRequest req) -> std::future<JoinResult>;

        auto PhaseNow() const noexcept -> Phase { return phase_; }
        auto RosterView() const noexcept -> Roster const& { return roster_; }
        auto Budget() const noexcept -> AbilityBudget const& { return budget_; }
        auto Moderator() const noexcept -> Identity const& { return moderator_; }

    private:
        // false on registration timeout
        auto RunLobby() -> bool;
        auto RevealWolves() -> void;
        auto RunNight(uint32_t round) -> RoundRecord;
        auto RunDay(uint32_t round, RoundRecord& record, std::vector<Identity> const& night_deaths) -> void;

        // MarkDead + log; returns the canonical identity if it was alive
        auto Eliminate(Identity const& who, Phase phase, uint32_t round) -> std::optional<Identity>;
        auto Finish(Outcome outcome) -> GameSummary;

        auto EnterPhase(Phase next) -> void;

    private:
        Config cfg_;
        std::shared_ptr<Transport> transport_;
        Identity moderator_;
        std::shared_ptr<auth::Gate const> gate_;
        std::unique_ptr<RandomSource> rng_;

        // Authoritative state
        Roster roster_;
        AbilityBudget budget_;
        Phase phase_{Phase::Lobby};
        std::shared_ptr<Lobby> lobby_;

        Messenger messenger_;
        Fanout fanout_;

        GameSummary summary_;
        bool started_{false};
    };
}

#endif //LUPUS_GAMEENGINE_HPP
