//
// Lobby.cpp
//

#include "Lobby.hpp"

#include <format>
#include <print>
#include <utility>

namespace lupus::core
{
    auto ToString(JoinStatus const s) noexcept -> std::string_view
    {
        switch (s)
        {
        case JoinStatus::Accepted: return "accepted";
        case JoinStatus::Duplicate: return "duplicate";
        case JoinStatus::Full: return "full";
        case JoinStatus::Unauthorized: return "unauthorized";
        case JoinStatus::Closed: return "closed";
        }
        return "unknown";
    }

    auto Lobby::Submit(JoinRequest req) -> std::future<JoinResult>
    {
        std::promise<JoinResult> reply;
        std::future<JoinResult> fut = reply.get_future();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_)
            {
                reply.set_value(JoinResult{JoinStatus::Closed, std::nullopt, "registration is closed"});
                return fut;
            }
            inbox_.push_back(Pending{std::move(req), std::move(reply)});
        }
        cv_.notify_all();
        return fut;
    }

    auto Lobby::WaitUntil(std::chrono::steady_clock::time_point const deadline) -> bool
    {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_until(lk, deadline, [&] { return !inbox_.empty() || closed_; });
        return !inbox_.empty();
    }

    auto Lobby::Drain(Roster& roster) -> std::size_t
    {
        std::deque<Pending> batch;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            batch.swap(inbox_);
        }

        std::size_t accepted{};
        for (Pending& p : batch)
        {
            JoinResult res = Admit(p.req, roster);
            if (res.Accepted()) ++accepted;
            p.reply.set_value(std::move(res));
        }
        return accepted;
    }

    auto Lobby::Admit(JoinRequest const& req, Roster& roster) const -> JoinResult
    {
        if (gate_)
        {
            try
            {
                gate_->Check(req.credentials);
            }
            catch (error::AuthorizationError const& e)
            {
                std::print("[Lobby] {} refused: {}\n", req.identity, error::to_string(e.data()));
                return JoinResult{JoinStatus::Unauthorized, std::nullopt, e.what()};
            }
        }

        std::optional<Role> const role = roster.Register(req.identity);
        if (!role)
        {
            bool const full = roster.OpenSlots() == 0;
            std::string detail = full ? std::string{"game is full"}
                               : !Roster::ValidIdentity(req.identity) ? std::format("'{}' is not a valid identity", req.identity)
                               : std::format("'{}' is already registered", req.identity);
            std::print("[Lobby] {} rejected: {}\n", req.identity, detail);
            return JoinResult{full ? JoinStatus::Full : JoinStatus::Duplicate, std::nullopt, std::move(detail)};
        }

        std::print("[Lobby] {} registered as {} ({} open)\n", req.identity, ToString(*role), roster.OpenSlots());
        return JoinResult{JoinStatus::Accepted, role, {}};
    }

    auto Lobby::Close() -> void
    {
        std::deque<Pending> left;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
            left.swap(inbox_);
        }
        for (Pending& p : left)
        {
            p.reply.set_value(JoinResult{JoinStatus::Closed, std::nullopt, "registration is closed"});
        }
        cv_.notify_all();
    }

    auto Lobby::IsClosed() const -> bool
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }
}
