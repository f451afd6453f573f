//
// Messenger.cpp
//

#include "Messenger.hpp"

#include <exception>
#include <format>
#include <thread>
#include <utility>

#include "Exception.hpp"
#include "Util.hpp"

namespace lupus::core
{
    auto ToString(DeliveryReason const r) noexcept -> std::string_view
    {
        switch (r)
        {
        case DeliveryReason::Unreachable: return "unreachable";
        case DeliveryReason::Timeout: return "timeout";
        case DeliveryReason::Malformed: return "malformed reply";
        }
        return "unknown";
    }

    PendingReply::PendingReply(Identity recipient,
                               std::future<Message> fut,
                               std::chrono::steady_clock::time_point const deadline) :
        recipient_{std::move(recipient)},
        fut_{std::move(fut)},
        deadline_{deadline}
    {
    }

    auto PendingReply::Await() -> DeliveryResult
    {
        auto const failure = [this](DeliveryReason reason, std::string detail)
        {
            return std::unexpected(DeliveryFailure{recipient_, reason, std::move(detail)});
        };

        if (!fut_.valid())
        {
            return failure(DeliveryReason::Unreachable, "reply already consumed");
        }
        if (fut_.wait_until(deadline_) != std::future_status::ready)
        {
            // the worker is detached; whatever it produces later is dropped
            return failure(DeliveryReason::Timeout, "no reply before deadline");
        }

        Message reply;
        try
        {
            reply = fut_.get();
        }
        catch (error::DeliveryError const& e)
        {
            return failure(DeliveryReason::Unreachable, e.what());
        }
        catch (OmegaException<error::Code> const& e)
        {
            return failure(DeliveryReason::Unreachable, e.what());
        }
        catch (std::exception const& e)
        {
            return failure(DeliveryReason::Unreachable, e.what());
        }

        if (reply.kind != MessageKind::Response)
        {
            return failure(DeliveryReason::Malformed,
                           std::format("expected response, got {}", ToString(reply.kind)));
        }
        // Seat spoofing guard
        if (reply.source.empty())
        {
            reply.source = recipient_;
        }
        else if (!util::EqualsCaseless(reply.source, recipient_))
        {
            return failure(DeliveryReason::Malformed,
                           std::format("reply claims to come from '{}'", reply.source));
        }
        return reply;
    }

    Messenger::Messenger(std::shared_ptr<Transport> transport,
                         Identity self,
                         std::chrono::milliseconds const timeout) :
        transport_{std::move(transport)},
        self_{std::move(self)},
        timeout_{timeout}
    {
        LPS_ASSERT(transport_ != nullptr, "Messenger without a transport");
    }

    auto Messenger::SendAsync(Message const& request, Identity const& recipient) const -> PendingReply
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout_;

        std::packaged_task<Message()> task(
            [tp = transport_,
             msg = request,
             to = recipient,
             from = self_,
             deadline]()
            {
                return tp->Send(msg, to, from, deadline);
            }
        );

        std::future<Message> fut = task.get_future();

        std::thread worker(std::move(task));
        worker.detach();

        return PendingReply{recipient, std::move(fut), deadline};
    }

    auto Messenger::Send(Message const& request, Identity const& recipient) const -> DeliveryResult
    {
        return SendAsync(request, recipient).Await();
    }
}
