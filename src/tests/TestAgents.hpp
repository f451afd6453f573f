//
// TestAgents.hpp: scripted participants and a fixed random source for tests
//

#ifndef LUPUS_TESTAGENTS_HPP
#define LUPUS_TESTAGENTS_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../core/Agent.hpp"
#include "../core/LocalTransport.hpp"
#include "../core/Random.hpp"

namespace lupus::test
{
    using namespace lupus::core;

    // Always picks the same index (clamped to n-1).
    class FixedRandom final : public RandomSource
    {
    public:
        explicit FixedRandom(std::size_t idx = 0) : idx_{idx} {}

        auto Pick(std::size_t n) -> std::size_t override { return idx_ < n ? idx_ : n - 1; }

    private:
        std::size_t idx_;
    };

    // Replies with a fixed answer per message kind ("" for kinds not scripted)
    // and remembers every request it received.
    class ScriptedAgent final : public Agent
    {
    public:
        struct Inbox
        {
            std::mutex mtx;
            std::vector<Message> seen;

            auto Snapshot() -> std::vector<Message>
            {
                std::lock_guard<std::mutex> lock(mtx);
                return seen;
            }

            auto Count(MessageKind k) -> std::size_t
            {
                std::lock_guard<std::mutex> lock(mtx);
                std::size_t n{};
                for (Message const& m : seen) n += m.kind == k;
                return n;
            }
        };

        ScriptedAgent(Identity self,
                      std::map<MessageKind, std::string> answers,
                      std::shared_ptr<Inbox> inbox,
                      std::chrono::milliseconds delay = std::chrono::milliseconds(0)) :
            self_{std::move(self)},
            answers_{std::move(answers)},
            inbox_{std::move(inbox)},
            delay_{delay}
        {
        }

        auto Handle(Message const& msg) -> Message override
        {
            {
                std::lock_guard<std::mutex> lock(inbox_->mtx);
                inbox_->seen.push_back(msg);
            }
            if (delay_.count() > 0) std::this_thread::sleep_for(delay_);

            auto const it = answers_.find(msg.kind);
            return MakeResponse(self_, it == answers_.end() ? std::string{} : it->second);
        }

    private:
        Identity self_;
        std::map<MessageKind, std::string> answers_;
        std::shared_ptr<Inbox> inbox_;
        std::chrono::milliseconds delay_;
    };

    inline auto RegisterScripted(LocalTransport& transport,
                                 Identity const& id,
                                 std::map<MessageKind, std::string> answers,
                                 std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        -> std::shared_ptr<ScriptedAgent::Inbox>
    {
        auto inbox = std::make_shared<ScriptedAgent::Inbox>();
        transport.Register(id, [id, answers = std::move(answers), inbox, delay]
        {
            return std::make_unique<ScriptedAgent>(id, answers, inbox, delay);
        });
        return inbox;
    }

    // Registers identities in order and returns their roles.
    template <class RosterT>
    auto Fill(RosterT& roster, std::vector<Identity> const& ids) -> std::map<Identity, Role>
    {
        std::map<Identity, Role> out;
        for (Identity const& id : ids)
        {
            if (auto const r = roster.Register(id)) out[id] = *r;
        }
        return out;
    }
}

#endif //LUPUS_TESTAGENTS_HPP
