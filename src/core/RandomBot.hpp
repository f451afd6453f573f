//
// RandomBot.hpp: participant that answers every prompt with a random well-formed reply
//

#ifndef LUPUS_RANDOMBOT_HPP
#define LUPUS_RANDOMBOT_HPP

#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "Agent.hpp"
#include "Types.hpp"

namespace lupus::core
{
    class RandomBot final : public Agent
    {
    public:
        RandomBot(Identity self, uint64_t rng_seed);

        auto Handle(Message const& msg) -> Message override;

        // Role reply from the moderator's register response; unknown until set.
        auto SetRole(std::optional<Role> role) noexcept -> void { role_ = role; }
        auto RoleNow() const noexcept -> std::optional<Role> { return role_; }

        // Names this bot currently believes alive (from moderator notices).
        auto Known() const noexcept -> std::vector<Identity> const& { return alive_; }

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

        auto Observe(Message const& msg) -> void;
        // alive names minus self (and fellow wolves when this bot is a wolf)
        auto Targets() const -> std::vector<Identity>;
        auto RandomTarget() -> std::string;

        auto Discuss() -> std::string;
        auto Move(std::string_view board) -> std::string;

    private:
        Identity self_;
        std::optional<Role> role_;
        std::vector<Identity> alive_;
        std::vector<Identity> wolves_;
        std::mt19937 rng_;
    };

    // Names listed after `marker` up to `until` (or the end of the sentence):
    // "players: a, b, c." -> {a,b,c}
    auto ParseNameList(std::string_view text, std::string_view marker, std::string_view until = {})
        -> std::vector<Identity>;
}

#endif //LUPUS_RANDOMBOT_HPP
