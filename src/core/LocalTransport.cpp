//
// LocalTransport.cpp
//

#include "LocalTransport.hpp"

#include <format>
#include <utility>

#include "Exception.hpp"

namespace lupus::core
{
    auto LocalTransport::Register(Identity const& identity, AgentFactory factory) -> void
    {
        LPS_ASSERT(static_cast<bool>(factory), "LocalTransport::Register without a factory");

        auto slot = std::make_shared<Slot>();
        slot->factory = std::move(factory);

        std::lock_guard<std::mutex> lock(mtx_);
        slots_[identity] = std::move(slot);
    }

    auto LocalTransport::Unregister(Identity const& identity) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        slots_.erase(identity);
    }

    auto LocalTransport::Send(Message const& msg,
                              Identity const& recipient,
                              Identity const& sender,
                              std::chrono::steady_clock::time_point const deadline) -> Message
    {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto const it = slots_.find(recipient);
            if (it != slots_.end()) slot = it->second;
        }
        if (!slot)
        {
            LPS_THROW(error::Code::Delivery, std::format("no agent registered as '{}'", recipient));
        }

        Message request = msg;
        if (request.source.empty()) request.source = sender;

        std::lock_guard<std::mutex> busy(slot->busy);
        if (!slot->agent)
        {
            slot->agent = slot->factory();
            LPS_ASSERT(slot->agent != nullptr, "agent factory returned null");
        }

        Message reply = slot->agent->Handle(request);

        // an in-process handler cannot be preempted; a late reply is still a timeout
        if (std::chrono::steady_clock::now() > deadline)
        {
            LPS_THROW(error::Code::Delivery, std::format("'{}' replied after the deadline", recipient));
        }
        return reply;
    }
}
