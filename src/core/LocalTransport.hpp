//
// LocalTransport.hpp: in-process transport (self-play, tests)
//

#ifndef LUPUS_LOCALTRANSPORT_HPP
#define LUPUS_LOCALTRANSPORT_HPP

#include <map>
#include <memory>
#include <mutex>

#include "Transport.hpp"

namespace lupus::core
{
    class LocalTransport final : public Transport
    {
    public:
        LocalTransport() = default;

        LocalTransport(LocalTransport const&) = delete;
        auto operator=(LocalTransport const&) -> LocalTransport& = delete;

        auto Register(Identity const& identity, AgentFactory factory) -> void override;
        auto Unregister(Identity const& identity) -> void;

        auto Send(Message const& msg,
                  Identity const& recipient,
                  Identity const& sender,
                  std::chrono::steady_clock::time_point deadline) -> Message override;

    private:
        struct Slot
        {
            AgentFactory factory;
            std::unique_ptr<Agent> agent; // built on first delivery
            std::mutex busy;              // one request at a time per agent
        };

        std::mutex mtx_;
        std::map<Identity, std::shared_ptr<Slot>> slots_;
    };
}

#endif //LUPUS_LOCALTRANSPORT_HPP
