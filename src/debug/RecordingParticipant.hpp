//
// RecordingParticipant.hpp: Agent decorator that keeps everything it saw
//

#ifndef LUPUS_RECORDINGPARTICIPANT_HPP
#define LUPUS_RECORDINGPARTICIPANT_HPP

#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "../core/Agent.hpp"

namespace lupus::core::debug
{
    struct Exchange
    {
        Message request;
        Message reply;
    };

    // Shared log so a test can read it after the transport owns the agent.
    class ExchangeLog
    {
    public:
        auto Add(Exchange e) -> void
        {
            std::lock_guard<std::mutex> lock(mtx_);
            log_.push_back(std::move(e));
        }

        auto All() const -> std::vector<Exchange>
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return log_;
        }

        auto Count(MessageKind kind) const -> std::size_t
        {
            std::lock_guard<std::mutex> lock(mtx_);
            return static_cast<std::size_t>(std::ranges::count_if(log_, [kind](Exchange const& e)
            {
                return e.request.kind == kind;
            }));
        }

    private:
        mutable std::mutex mtx_;
        std::vector<Exchange> log_;
    };

    class RecordingParticipant final : public Agent
    {
    public:
        RecordingParticipant(std::unique_ptr<Agent> inner, std::shared_ptr<ExchangeLog> log)
            : inner_{std::move(inner)}, log_{std::move(log)}
        {
        }

        auto Handle(Message const& msg) -> Message override
        {
            Message reply = inner_->Handle(msg);
            log_->Add(Exchange{msg, reply});
            return reply;
        }

    private:
        std::unique_ptr<Agent> inner_;
        std::shared_ptr<ExchangeLog> log_;
    };

    // Helper to wrap a factory so every agent it builds records into log
    inline auto WrapRecording(AgentFactory inner, std::shared_ptr<ExchangeLog> log) -> AgentFactory
    {
        return [inner = std::move(inner), log = std::move(log)]() -> std::unique_ptr<Agent>
        {
            return std::make_unique<RecordingParticipant>(inner(), log);
        };
    }
} // namespace lupus::core::debug

#endif //LUPUS_RECORDINGPARTICIPANT_HPP
