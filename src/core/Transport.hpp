//
// Transport.hpp: message-passing substrate the engine talks through
//

#ifndef LUPUS_TRANSPORT_HPP
#define LUPUS_TRANSPORT_HPP

#include <chrono>

#include "Agent.hpp"
#include "Message.hpp"

namespace lupus::core
{
    class Transport
    {
    public:
        virtual ~Transport() = default;

        // Make an agent reachable under identity. The factory is invoked lazily.
        virtual auto Register(Identity const& identity, AgentFactory factory) -> void = 0;

        // One request/response round-trip. Throws error::DeliveryError when the
        // recipient is unknown, unreachable or the deadline passes.
        virtual auto Send(Message const& msg,
                          Identity const& recipient,
                          Identity const& sender,
                          std::chrono::steady_clock::time_point deadline) -> Message = 0;
    };
}

#endif //LUPUS_TRANSPORT_HPP
