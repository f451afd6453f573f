#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "../core/Util.hpp"

using namespace lupus::core;

namespace
{

auto s_opt(std::optional<std::string> const& v) -> std::string_view
{
    return v ? std::string_view{*v} : std::string_view{"-"};
}

auto s_table(RoleTable const& table) -> std::string
{
    std::string body;
    for (auto const& [role, count] : table)
    {
        body += std::format("{}{}:{}", body.empty() ? "" : ",", ToString(role), count);
    }
    return body;
}

auto s_seating(Roster const& roster) -> std::string
{
    std::string body;
    for (Participant const& p : roster.Slots())
    {
        body += std::format("{}{}={}{}",
                            body.empty() ? "" : ",",
                            p.Registered() ? p.identity : std::string{"<open>"},
                            ToString(p.role),
                            p.alive ? "" : "(dead)");
    }
    return body;
}

} // anonymous namespace

namespace lupus::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Config const& cfg, Roster const& roster) -> void
{
    out_ << std::format("Seed={}\n", cfg.seed);
    out_ << std::format("Roles={}\n", s_table(cfg.roles));
    out_ << std::format("MaxRounds={} Fanout={}\n", cfg.max_rounds,
                        cfg.fanout_mode == FanoutMode::Sequential ? "sequential" : "concurrent");
    out_ << std::format("Seating=[{}]\n", s_seating(roster));
    out_.flush();
}

auto AuditLogger::round(RoundRecord const& r) -> void
{
    NightReport const& n = r.night;
    out_ << std::format("Night {} votes->{} kill={} healed={} poison={}{}\n",
                        r.round,
                        s_opt(n.most_voted),
                        s_opt(n.kill),
                        n.healed ? "yes" : "no",
                        s_opt(n.poison),
                        n.poison_used && !n.poison ? "(unresolved)" : "");
    if (n.investigation)
    {
        out_ << std::format("Seer: {} is {}\n", n.investigation->target, ToString(n.investigation->role));
    }

    if (!r.day)
    {
        return;
    }
    for (Message const& speech : r.day->speeches)
    {
        out_ << std::format("Say {}: {}\n", speech.source, util::Trim(speech.content));
    }
    out_ << std::format("Day {} ballots={} out={}\n", r.round, r.day->ballots, s_opt(r.day->voted_out));
}

auto AuditLogger::end(GameSummary const& summary, Roster const& roster) -> void
{
    std::vector<std::string> deaths;
    deaths.reserve(summary.eliminations.size());
    for (Elimination const& e : summary.eliminations)
    {
        deaths.push_back(std::format("{}@{}{}", e.identity, ToString(e.phase), e.round));
    }

    out_ << std::format("Deaths=[{}]\n", util::Join(deaths, ","));
    out_ << std::format("Survivors=[{}]\n", util::Join(roster.Survivors(), ","));
    out_ << std::format("Rounds={} Outcome={}\n", summary.rounds_played, ToString(summary.outcome));
    out_.flush();
}

auto AuditLogger::match(MatchResult const& result) -> void
{
    for (Ply const& p : result.plies)
    {
        out_ << std::format("{} {} '{}'{}\n", ToString(p.side), p.player, p.move, p.applied ? "" : " forfeited");
    }
    out_ << std::format("Winner={}\n", s_opt(result.winner));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace lupus::core::debug
