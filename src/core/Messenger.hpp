//
// Messenger.hpp: one deadline-bounded round-trip to one participant
//

#ifndef LUPUS_MESSENGER_HPP
#define LUPUS_MESSENGER_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <future>
#include <memory>
#include <string>
#include <string_view>

#include "Message.hpp"
#include "Transport.hpp"

namespace lupus::core
{
    enum class DeliveryReason : uint8_t
    {
        Unreachable, // transport error, unknown recipient
        Timeout,
        Malformed // reply of the wrong kind or from someone else
    };

    struct DeliveryFailure
    {
        Identity recipient;
        DeliveryReason reason{DeliveryReason::Unreachable};
        std::string detail;
    };

    auto ToString(DeliveryReason r) noexcept -> std::string_view;

    using DeliveryResult = std::expected<Message, DeliveryFailure>;

    // A send in flight. Await() never throws.
    class PendingReply
    {
    public:
        PendingReply(Identity recipient,
                     std::future<Message> fut,
                     std::chrono::steady_clock::time_point deadline);

        auto Await() -> DeliveryResult;

        auto Recipient() const noexcept -> Identity const& { return recipient_; }

    private:
        Identity recipient_;
        std::future<Message> fut_;
        std::chrono::steady_clock::time_point deadline_;
    };

    class Messenger
    {
    public:
        Messenger(std::shared_ptr<Transport> transport,
                  Identity self,
                  std::chrono::milliseconds timeout);

        // Starts the round-trip on a worker and returns immediately.
        auto SendAsync(Message const& request, Identity const& recipient) const -> PendingReply;

        auto Send(Message const& request, Identity const& recipient) const -> DeliveryResult;

        auto Self() const noexcept -> Identity const& { return self_; }
        auto Timeout() const noexcept -> std::chrono::milliseconds { return timeout_; }

    private:
        std::shared_ptr<Transport> transport_;
        Identity self_;
        std::chrono::milliseconds timeout_;
    };
}

#endif //LUPUS_MESSENGER_HPP
