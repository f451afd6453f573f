//
// Agent.hpp: message handler interface for participants and the moderator
//

#ifndef LUPUS_AGENT_HPP
#define LUPUS_AGENT_HPP

#include <functional>
#include <map>
#include <memory>
#include <utility>

#include "Message.hpp"

namespace lupus::core
{
    class Agent
    {
    public:
        virtual ~Agent() = default;

        // Called by a transport for each inbound request; the return value is the reply.
        virtual auto Handle(Message const& msg) -> Message = 0;
    };

    using AgentFactory = std::function<std::unique_ptr<Agent>()>;

    // Routes a message to the handler registered for its kind.
    // Kinds without a handler get an empty response.
    class Dispatcher final : public Agent
    {
    public:
        using Handler = std::function<Message(Message const&)>;

        explicit Dispatcher(Identity self) : self_{std::move(self)} {}

        auto On(MessageKind kind, Handler h) -> Dispatcher&
        {
            handlers_[kind] = std::move(h);
            return *this;
        }

        auto Handle(Message const& msg) -> Message override
        {
            auto const it = handlers_.find(msg.kind);
            if (it == handlers_.end())
            {
                return MakeResponse(self_, {});
            }
            return it->second(msg);
        }

    private:
        Identity self_;
        std::map<MessageKind, Handler> handlers_;
    };
}

#endif //LUPUS_AGENT_HPP
