//
// BoardMatch.cpp
//

#include "BoardMatch.hpp"

#include <format>
#include <print>
#include <utility>

#include "Exception.hpp"
#include "Util.hpp"

namespace lupus::core
{
    auto ExtractMove(std::string_view const reply) -> std::string
    {
        constexpr std::string_view marker = "move:";
        std::string const lowered = util::ToLower(reply);

        // last marker wins, "thinking" text may mention moves too
        auto const at = lowered.rfind(marker);
        if (at == std::string::npos)
        {
            return std::string{util::Trim(reply)};
        }
        std::string_view rest = reply.substr(at + marker.size());
        // tolerate trailing prose after the move: "move: e2e4, because ..."
        if (auto const stop = rest.find_first_of(",;\n"); stop != std::string_view::npos)
        {
            rest = rest.substr(0, stop);
        }
        return std::string{util::Trim(rest)};
    }

    BoardMatch::BoardMatch(std::unique_ptr<SubGameRules> rules,
                           std::shared_ptr<Transport> transport,
                           Identity moderator,
                           std::chrono::milliseconds const send_timeout,
                           uint64_t const seed,
                           uint32_t const max_plies) :
        rules_(std::move(rules)),
        moderator_(std::move(moderator)),
        max_plies_(max_plies),
        rng_(seed),
        roster_(RoleTable{{Role::White, 1}, {Role::Black, 1}}, rng_),
        messenger_(std::move(transport), moderator_, send_timeout),
        fanout_(roster_, messenger_, FanoutMode::Sequential)
    {
        LPS_ASSERT(rules_ != nullptr, "BoardMatch needs rules");
    }

    auto BoardMatch::Seat(std::string_view const identity) -> std::optional<Role>
    {
        return roster_.Register(identity);
    }

    auto BoardMatch::PlayerOf(Role const side) const -> Identity
    {
        std::vector<Identity> const holders = roster_.PeersOf(side);
        LPS_ASSERT(!holders.empty(), std::format("no player seated as {}", ToString(side)));
        return holders.front();
    }

    auto BoardMatch::Play() -> MatchResult
    {
        if (roster_.OpenSlots() != 0)
        {
            LPS_THROW(error::Code::State, "BoardMatch::Play before both sides are seated");
        }

        MatchResult result{};
        Role side = Role::White;

        for (uint32_t ply = 1; ply <= max_plies_; ++ply)
        {
            if (rules_->IsOver())
            {
                break;
            }

            Identity const player = PlayerOf(side);
            Ply record{side, player, {}, false};

            std::optional<Message> const reply =
                fanout_.Ask(Message{MessageKind::Move, moderator_, rules_->Describe(side)}, player);
            if (reply)
            {
                record.move = ExtractMove(reply->content);
                if (rules_->IsLegal(side, record.move))
                {
                    rules_->Apply(side, record.move);
                    record.applied = true;
                }
                else
                {
                    std::print("[Match] {} {}: illegal move '{}', ply forfeited\n", ply, ToString(side), record.move);
                }
            }
            else
            {
                std::print("[Match] {} {}: no reply, ply forfeited\n", ply, ToString(side));
            }

            result.plies.push_back(std::move(record));
            side = side == Role::White ? Role::Black : Role::White;
        }

        if (std::optional<Role> const w = rules_->Winner())
        {
            result.winner = PlayerOf(*w);
        }
        std::print("[Match] over after {} plies, winner: {}\n", result.plies.size(), result.winner.value_or("<none>"));
        return result;
    }
}
