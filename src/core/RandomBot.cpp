//
// RandomBot.cpp
//

#include "RandomBot.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

#include "Util.hpp"

namespace lupus::core
{
    auto ParseNameList(std::string_view const text,
                       std::string_view const marker,
                       std::string_view const until) -> std::vector<Identity>
    {
        std::string const lowered = util::ToLower(text);
        auto const at = lowered.find(util::ToLower(marker));
        if (at == std::string::npos) return {};

        std::string_view rest = text.substr(at + marker.size());
        if (!until.empty())
        {
            if (auto const end = util::ToLower(rest).find(util::ToLower(until)); end != std::string::npos)
            {
                rest = rest.substr(0, end);
            }
        }
        if (auto const stop = rest.find_first_of(".\n?"); stop != std::string_view::npos)
        {
            rest = rest.substr(0, stop);
        }
        return util::SplitList(rest, ',');
    }

    RandomBot::RandomBot(Identity self, uint64_t const rng_seed) :
        self_(std::move(self)),
        rng_(static_cast<std::mt19937::result_type>(rng_seed))
    {
    }

    auto RandomBot::Handle(Message const& msg) -> Message
    {
        Observe(msg);

        switch (msg.kind)
        {
        case MessageKind::NightKill:
        case MessageKind::DayVote:
            return MakeResponse(self_, RandomTarget());

        case MessageKind::Divine:
        {
            std::vector<Identity> const listed = ParseNameList(msg.content, "in:", "would you like");
            if (!listed.empty()) alive_ = listed;
            return MakeResponse(self_, RandomTarget());
        }

        case MessageKind::Save:
            return MakeResponse(self_, pick(std::vector{0, 1}) ? "yes" : "no");

        case MessageKind::Poison:
            // mostly keep the potion
            if (std::uniform_int_distribution<int>{0, 3}(rng_) != 0) return MakeResponse(self_, "no");
            return MakeResponse(self_, RandomTarget());

        case MessageKind::DayDiscuss:
            return MakeResponse(self_, Discuss());

        case MessageKind::Move:
            return MakeResponse(self_, Move(msg.content));

        default:
            return MakeResponse(self_, {});
        }
    }

    auto RandomBot::Observe(Message const& msg) -> void
    {
        if (msg.kind == MessageKind::ImportantInfo)
        {
            wolves_ = ParseNameList(msg.content, "The wolves are:");
            // only wolves are told
            if (!role_) role_ = Role::Wolf;
            return;
        }

        if (std::vector<Identity> v = ParseNameList(msg.content, "survive players:"); !v.empty())
        {
            alive_ = std::move(v);
        }
        else if (std::vector<Identity> a = ParseNameList(msg.content, "alive players are:"); !a.empty())
        {
            alive_ = std::move(a);
        }

        std::vector<Identity> gone = ParseNameList(msg.content, "has been eliminated:");
        if (std::vector<Identity> voted = ParseNameList(msg.content, "The voting result is: Player"); !voted.empty())
        {
            // "x has been eliminated" trails the name
            std::string const name{util::Trim(std::string_view(voted.front()).substr(
                0, voted.front().find(" has been eliminated")))};
            gone.push_back(name);
        }
        std::erase_if(alive_, [&](Identity const& n)
        {
            return std::ranges::any_of(gone, [&](Identity const& g) { return util::EqualsCaseless(g, n); });
        });
    }

    auto RandomBot::Targets() const -> std::vector<Identity>
    {
        bool const wolf = role_ == Role::Wolf;
        auto keep = [&](Identity const& n)
        {
            if (util::EqualsCaseless(n, self_)) return false;
            if (!wolf) return true;
            return std::ranges::none_of(wolves_, [&](Identity const& w) { return util::EqualsCaseless(w, n); });
        };
        return std::ranges::to<std::vector<Identity>>(alive_ | std::views::filter(keep));
    }

    auto RandomBot::RandomTarget() -> std::string
    {
        std::vector<Identity> const cand = Targets();
        if (cand.empty()) return {};
        return cand[pick(cand)];
    }

    auto RandomBot::Discuss() -> std::string
    {
        std::string const suspect = RandomTarget();
        if (suspect.empty()) return "I have nothing to add.";
        return std::format("I am a villager. I suspect {}.", suspect);
    }

    auto RandomBot::Move(std::string_view const board) -> std::string
    {
        std::vector<Identity> const moves = ParseNameList(board, "Possible moves are:");
        if (moves.empty()) return "thinking: no moves listed move: pass";
        return std::format("thinking: random pick move: {}", moves[pick(moves)]);
    }
}
