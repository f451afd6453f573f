//
// Lobby.hpp: join mailbox between transport threads and the engine loop
//

#ifndef LUPUS_LOBBY_HPP
#define LUPUS_LOBBY_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "../auth/Auth.hpp"
#include "Roster.hpp"

namespace lupus::core
{
    enum class JoinStatus : uint8_t
    {
        Accepted,
        Duplicate,    // identity already registered (or empty)
        Full,         // no open slot
        Unauthorized, // auth gate refused the credentials
        Closed        // lobby no longer takes joins
    };

    auto ToString(JoinStatus s) noexcept -> std::string_view;

    struct JoinRequest
    {
        Identity identity;
        auth::Credentials credentials;
    };

    struct JoinResult
    {
        JoinStatus status{JoinStatus::Closed};
        std::optional<Role> role;
        std::string detail;

        auto Accepted() const noexcept -> bool { return status == JoinStatus::Accepted; }
    };

    // Any thread may Submit(); only the engine thread drains into the roster.
    // Every submitted future is resolved, at the latest by Close().
    class Lobby
    {
    public:
        explicit Lobby(auth::Gate const* gate = nullptr) : gate_{gate} {}

        Lobby(Lobby const&) = delete;
        auto operator=(Lobby const&) -> Lobby& = delete;

        auto Submit(JoinRequest req) -> std::future<JoinResult>;

        // Blocks until a request is queued or the deadline passes. True if work is pending.
        auto WaitUntil(std::chrono::steady_clock::time_point deadline) -> bool;

        // Authorizes and registers queued requests. Returns how many were accepted.
        auto Drain(Roster& roster) -> std::size_t;

        // Resolves everything queued (and submitted later) with JoinStatus::Closed.
        auto Close() -> void;

        auto IsClosed() const -> bool;

    private:
        struct Pending
        {
            JoinRequest req;
            std::promise<JoinResult> reply;
        };

        auto Admit(JoinRequest const& req, Roster& roster) const -> JoinResult;

    private:
        auth::Gate const* gate_;

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<Pending> inbox_;
        bool closed_{false};
    };
}

#endif //LUPUS_LOBBY_HPP
