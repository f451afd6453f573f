//
// Fanout.cpp
//

#include "Fanout.hpp"

#include <print>
#include <utility>

namespace lupus::core
{
    Fanout::Fanout(Roster const& roster, Messenger const& messenger, FanoutMode const mode) :
        roster_{&roster},
        messenger_{&messenger},
        mode_{mode}
    {
    }

    auto Fanout::Collect(Message const& request, RoleFilter const filter) const -> std::vector<Message>
    {
        // recipient list is fixed here; the roster is not consulted again until we return
        std::vector<Participant> const recipients = roster_->AliveOfRole(filter);

        std::vector<Message> replies;
        replies.reserve(recipients.size());

        if (mode_ == FanoutMode::Sequential)
        {
            for (Participant const& p : recipients)
            {
                DeliveryResult res = messenger_->Send(request, p.identity);
                if (!res.has_value())
                {
                    LogFailure(request, res.error());
                    continue;
                }
                replies.push_back(std::move(*res));
            }
            return replies;
        }

        std::vector<PendingReply> pending;
        pending.reserve(recipients.size());
        for (Participant const& p : recipients)
        {
            pending.push_back(messenger_->SendAsync(request, p.identity));
        }

        // await in roster order, not completion order
        for (PendingReply& pr : pending)
        {
            DeliveryResult res = pr.Await();
            if (!res.has_value())
            {
                LogFailure(request, res.error());
                continue;
            }
            replies.push_back(std::move(*res));
        }
        return replies;
    }

    auto Fanout::Ask(Message const& request, Identity const& recipient) const -> std::optional<Message>
    {
        DeliveryResult res = messenger_->Send(request, recipient);
        if (!res.has_value())
        {
            LogFailure(request, res.error());
            return std::nullopt;
        }
        return std::move(*res);
    }

    auto Fanout::Broadcast(Message const& notice, RoleFilter const filter) const -> std::size_t
    {
        return Collect(notice, filter).size();
    }

    auto Fanout::LogFailure(Message const& request, DeliveryFailure const& f) const -> void
    {
        std::print("[Fanout] {} -> {} failed ({}): {}\n",
                   ToString(request.kind), f.recipient, ToString(f.reason), f.detail);
    }
}
