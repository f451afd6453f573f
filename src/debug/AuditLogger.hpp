//
// AuditLogger.hpp: per-game transcript file for self-play and soak tests
//

#ifndef LUPUS_AUDITLOGGER_HPP
#define LUPUS_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/BoardMatch.hpp"
#include "../core/GameEngine.hpp"
#include "../core/Roster.hpp"
#include "../core/Types.hpp"

namespace lupus::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, role table, seating)
        auto start(Config const& cfg, Roster const& roster) -> void;

        // One night (and its day, if the game got that far)
        auto round(RoundRecord const& r) -> void;

        // Game end footer (outcome, deaths in order, survivors)
        auto end(GameSummary const& summary, Roster const& roster) -> void;

        auto match(MatchResult const& result) -> void;

        // Manual flush
        auto flush() -> void;

        auto good() const -> bool { return out_.good(); }

    private:
        std::ofstream out_;
    };
}

#endif //LUPUS_AUDITLOGGER_HPP
