//
// Fanout.hpp: role-scoped request to many participants, best-effort quorum
//

#ifndef LUPUS_FANOUT_HPP
#define LUPUS_FANOUT_HPP

#include <cstddef>
#include <vector>

#include "Messenger.hpp"
#include "Roster.hpp"
#include "Types.hpp"

namespace lupus::core
{
    class Fanout
    {
    public:
        Fanout(Roster const& roster, Messenger const& messenger, FanoutMode mode);

        // Replies from every alive participant matching filter, in roster order.
        // Delivery failures are logged and left out.
        auto Collect(Message const& request, RoleFilter filter) const -> std::vector<Message>;

        // Single recipient; failure is logged and reported as nullopt.
        auto Ask(Message const& request, Identity const& recipient) const -> std::optional<Message>;

        // Collect() with the replies discarded. Returns how many were delivered.
        auto Broadcast(Message const& notice, RoleFilter filter) const -> std::size_t;

        auto Mode() const noexcept -> FanoutMode { return mode_; }

    private:
        auto LogFailure(Message const& request, DeliveryFailure const& f) const -> void;

    private:
        Roster const* roster_;
        Messenger const* messenger_;
        FanoutMode mode_;
    };
}

#endif //LUPUS_FANOUT_HPP
