//
// NightPipeline.hpp: wolf vote, witch potions, seer investigation
//

#ifndef LUPUS_NIGHTPIPELINE_HPP
#define LUPUS_NIGHTPIPELINE_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Fanout.hpp"
#include "Random.hpp"
#include "Roster.hpp"

namespace lupus::core
{
    // One-time potions. Each flag goes true -> false once and never resets.
    class AbilityBudget
    {
    public:
        auto HealAvailable() const noexcept -> bool { return heal_; }
        auto PoisonAvailable() const noexcept -> bool { return poison_; }

        auto ConsumeHeal() noexcept -> bool { return std::exchange(heal_, false); }
        auto ConsumePoison() noexcept -> bool { return std::exchange(poison_, false); }

    private:
        bool heal_{true};
        bool poison_{true};
    };

    struct Investigation
    {
        Identity target;
        Role role{};
    };

    struct NightReport
    {
        std::optional<std::string> most_voted; // raw tally result, before resolution
        std::optional<Identity> kill;           // canonical, cleared when healed
        std::optional<Identity> poison;         // canonical
        bool healed{false};
        bool poison_used{false};
        std::optional<Investigation> investigation;

        // kill first, then poison
        auto Pending() const -> std::vector<Identity>;
    };

    // Runs inside the engine loop. Reads the roster, never writes it;
    // the engine applies the pending eliminations.
    class NightPipeline
    {
    public:
        NightPipeline(Roster const& roster,
                      Fanout const& fanout,
                      RandomSource& rng,
                      Identity moderator);

        auto Run(AbilityBudget& budget) -> NightReport;

    private:
        auto WolfVote(NightReport& report) -> void;
        auto WitchSave(AbilityBudget& budget, NightReport& report) -> void;
        auto WitchPoison(AbilityBudget& budget, NightReport& report) -> void;
        auto SeerDivine(NightReport& report) -> void;

        auto Notice(std::string content) const -> Message;
        auto Request(MessageKind kind, std::string content) const -> Message;
        auto FirstAlive(Role role) const -> std::optional<Identity>;

    private:
        Roster const* roster_;
        Fanout const* fanout_;
        RandomSource* rng_;
        Identity moderator_;
    };
}

#endif //LUPUS_NIGHTPIPELINE_HPP
