//
// WsTransport.cpp
//

#include "WsTransport.hpp"

#include <format>
#include <print>
#include <random>
#include <utility>
#include <vector>

#include "../auth/Auth.hpp"
#include "../core/Exception.hpp"
#include "../core/Util.hpp"

namespace lupus::core::net
{
    namespace
    {
        auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::uint8_t const>
        {
            return {buf.data(), buf.size()};
        }

        auto NewResumeToken() -> std::string
        {
            std::random_device rd;
            std::uniform_int_distribution<std::uint64_t> dist;
            return std::format("{:016x}{:016x}", dist(rd), dist(rd));
        }

        auto SendWelcome(std::shared_ptr<Channel> const& chan, JoinResult const& res, std::string const& token = {})
            -> void
        {
            flatbuffers::DetachedBuffer const buf = BuildWelcome(res, token);
            if (!chan->SendBinary(AsBytes(buf)))
            {
                std::print("[Server] welcome to {} not delivered\n", chan->identity);
            }
        }
    }

    // ---------- Channel ----------

    void Channel::Expect(std::uint64_t const id)
    {
        std::lock_guard<std::mutex> lock(mtx);
        waiting.emplace(id, std::nullopt);
    }

    void Channel::Deliver(std::uint64_t const id, Message msg)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto const it = waiting.find(id);
            if (it == waiting.end())
            {
                return;
            }
            it->second = std::move(msg);
        }
        cv.notify_all();
    }

    bool Channel::WaitReplyUntil(std::uint64_t const id,
                                 Message& out,
                                 std::chrono::steady_clock::time_point const deadline)
    {
        std::unique_lock<std::mutex> lk(mtx);
        cv.wait_until(lk, deadline, [&]
        {
            auto const it = waiting.find(id);
            return !connected || (it != waiting.end() && it->second.has_value());
        });

        auto node = waiting.extract(id);
        if (node.empty() || !node.mapped().has_value())
        {
            return false;
        }
        out = std::move(*node.mapped());
        return true;
    }

    void Channel::Disconnect()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            connected = false;
        }
        cv.notify_all();
    }

    bool Channel::SendBinary(std::span<std::uint8_t const> const bytes)
    {
        auto ep_sp = ep.lock();
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!ep_sp || !connected)
            {
                return false;
            }
        }

        websocketpp::lib::error_code ec;
        ep_sp->send(hdl,
                    reinterpret_cast<const void*>(bytes.data()),
                    bytes.size(),
                    websocketpp::frame::opcode::binary,
                    ec);
        return !ec;
    }

    // ---------- ChannelRegistry ----------

    auto ChannelRegistry::Find(Identity const& identity) const -> std::shared_ptr<Channel>
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto const it = by_identity.find(util::ToLower(identity));
        return it != by_identity.end() ? it->second : nullptr;
    }

    auto ChannelRegistry::Bind(Identity const& identity,
                               std::shared_ptr<Channel> const& chan,
                               std::string const& resume_token) -> BindOutcome
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::shared_ptr<Channel>& slot = by_identity[util::ToLower(identity)];
        if (!slot || slot == chan)
        {
            slot = chan;
            return BindOutcome::Fresh;
        }

        std::lock_guard<std::mutex> held(slot->mtx);
        if (slot->connected)
        {
            return BindOutcome::Taken;
        }
        if (!slot->role)
        {
            // dropped before its join was answered; the lobby decides again
            slot = chan;
            return BindOutcome::Fresh;
        }
        if (resume_token.empty() || resume_token != slot->resume_token)
        {
            return BindOutcome::Refused;
        }

        std::lock_guard<std::mutex> fresh(chan->mtx);
        chan->role = slot->role;
        chan->resume_token = slot->resume_token;
        slot = chan;
        return BindOutcome::Reclaimed;
    }

    auto ChannelRegistry::Unbind(Identity const& identity, std::shared_ptr<Channel> const& chan) -> void
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto const it = by_identity.find(util::ToLower(identity));
        if (it != by_identity.end() && it->second == chan)
        {
            by_identity.erase(it);
        }
    }

    // ---------- WsTransport ----------

    WsTransport::WsTransport(std::uint16_t const port, std::string session, std::shared_ptr<auth::Gate const> gate) :
        port_(port),
        session_(std::move(session)),
        gate_(std::move(gate)),
        server_(std::make_shared<WsServer>()),
        reg_(std::make_shared<ChannelRegistry>())
    {
        if (session_.empty())
        {
            LPS_THROW(error::Code::Config, "WsTransport needs a session id");
        }

        server_->clear_access_channels(websocketpp::log::alevel::all);
        server_->set_access_channels(websocketpp::log::alevel::connect |
            websocketpp::log::alevel::disconnect);
        server_->init_asio();
        server_->set_reuse_addr(true);

        server_->set_open_handler([this](Hdl hdl) { HandleOpen(std::move(hdl)); });
        server_->set_close_handler([this](Hdl hdl) { HandleClose(std::move(hdl)); });
        server_->set_message_handler([this](Hdl hdl, WsServer::message_ptr msg)
        {
            HandleMessage(std::move(hdl), std::move(msg));
        });
    }

    WsTransport::~WsTransport()
    {
        Stop();
    }

    auto WsTransport::OnJoin(JoinHandler handler) -> void
    {
        join_ = std::move(handler);
    }

    auto WsTransport::Start() -> void
    {
        LPS_ASSERT(static_cast<bool>(join_), "WsTransport::Start without a join handler");
        if (running_) return;

        server_->listen(port_);
        server_->start_accept();
        net_thr_ = std::thread([srv = server_]()
        {
            srv->run();
        });
        running_ = true;
        std::print("[Server] Listening on port {} (session {})\n", port_, session_);
    }

    auto WsTransport::Stop() -> void
    {
        if (!running_) return;
        running_ = false;

        websocketpp::lib::error_code ec;
        server_->stop_listening(ec);
        if (ec)
        {
            std::print("[Server] stop_listening: {}\n", ec.message());
        }

        std::vector<std::shared_ptr<Channel>> open;
        {
            std::lock_guard<std::mutex> lock(reg_->mtx);
            for (auto const& [hdl, chan] : reg_->by_hdl) open.push_back(chan);
        }
        for (std::shared_ptr<Channel> const& chan : open)
        {
            websocketpp::lib::error_code cec;
            server_->close(chan->hdl, websocketpp::close::status::going_away, "Game over", cec);
            chan->Disconnect();
        }

        // run() returns once the last connection is gone
        if (net_thr_.joinable())
        {
            net_thr_.join();
        }
    }

    auto WsTransport::Register(Identity const& identity, AgentFactory factory) -> void
    {
        local_.Register(identity, std::move(factory));
    }

    auto WsTransport::Send(Message const& msg,
                           Identity const& recipient,
                           Identity const& sender,
                           std::chrono::steady_clock::time_point const deadline) -> Message
    {
        std::shared_ptr<Channel> const chan = reg_->Find(recipient);
        if (!chan)
        {
            // hosted agents, or an unknown recipient (LocalTransport throws)
            return local_.Send(msg, recipient, sender, deadline);
        }

        Message request = msg;
        if (request.source.empty()) request.source = sender;

        std::uint64_t const id = next_request_id_.fetch_add(1);
        chan->Expect(id);

        flatbuffers::DetachedBuffer const buf = BuildRequest(id, request);
        if (!chan->SendBinary(AsBytes(buf)))
        {
            Message discard;
            chan->WaitReplyUntil(id, discard, std::chrono::steady_clock::now());
            LPS_THROW(error::Code::Delivery, std::format("'{}' is not connected", recipient));
        }

        Message reply;
        if (!chan->WaitReplyUntil(id, reply, deadline))
        {
            LPS_THROW(error::Code::Delivery, std::format("no reply from '{}' to request {}", recipient, id));
        }
        return reply;
    }

    auto WsTransport::ConnectedCount() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(reg_->mtx);
        return reg_->by_hdl.size();
    }

    auto WsTransport::HandleOpen(Hdl hdl) -> void
    {
        auto chan = std::make_shared<Channel>();
        chan->ep = server_;
        chan->hdl = hdl;
        chan->connected = true;

        std::lock_guard<std::mutex> lock(reg_->mtx);
        reg_->by_hdl[hdl] = std::move(chan);
    }

    auto WsTransport::HandleClose(Hdl hdl) -> void
    {
        std::shared_ptr<Channel> chan;
        {
            std::lock_guard<std::mutex> lock(reg_->mtx);
            auto const it = reg_->by_hdl.find(hdl);
            if (it == reg_->by_hdl.end())
            {
                return;
            }
            chan = it->second;
            reg_->by_hdl.erase(it);
        }
        // identity stays bound so the seat can be reclaimed by a reconnect
        chan->Disconnect();
        std::print("[Server] {} disconnected\n", chan->identity.empty() ? "<anonymous>" : chan->identity);
    }

    auto WsTransport::HandleMessage(Hdl hdl, WsServer::message_ptr msg) -> void
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Server] Ignoring non-binary frame from client\n");
            return;
        }

        std::shared_ptr<Channel> chan;
        {
            std::lock_guard<std::mutex> lock(reg_->mtx);
            auto const it = reg_->by_hdl.find(hdl);
            if (it == reg_->by_hdl.end())
            {
                return;
            }
            chan = it->second;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> const bytes{
            reinterpret_cast<std::byte const*>(payload.data()),
            payload.size()
        };

        std::expected<Frame, ParseError> frame = DecodeFrame(bytes);
        if (!frame.has_value())
        {
            std::print("[Server] Parse error from {}: {}\n", chan->identity, frame.error().message);
            return;
        }

        if (auto* hello = std::get_if<HelloFrame>(&*frame))
        {
            HandleHello(chan, std::move(*hello));
        }
        else if (auto* reply = std::get_if<ReplyFrame>(&*frame))
        {
            if (chan->identity.empty())
            {
                std::print("[Server] Reply before Hello ignored\n");
                return;
            }
            chan->Deliver(reply->request_id, std::move(reply->msg));
        }
        else
        {
            std::print("[Server] Unexpected frame from {}\n", chan->identity);
        }
    }

    auto WsTransport::HandleHello(std::shared_ptr<Channel> const& chan, HelloFrame hello) -> void
    {
        if (!chan->identity.empty())
        {
            std::print("[Server] Duplicate Hello from {} ignored\n", chan->identity);
            return;
        }
        if (hello.session != session_)
        {
            SendWelcome(chan, JoinResult{JoinStatus::Unauthorized, std::nullopt,
                                         std::format("unknown session '{}'", hello.session)});
            return;
        }
        auth::Credentials const creds{hello.identity, hello.timestamp, hello.signature};

        // a held seat is only handed over to credentials the gate still accepts
        if (gate_ && !hello.resume_token.empty())
        {
            try
            {
                gate_->Check(creds);
            }
            catch (error::AuthorizationError const& e)
            {
                std::print("[Server] reconnect of {} refused: {}\n", hello.identity, e.what());
                SendWelcome(chan, JoinResult{JoinStatus::Unauthorized, std::nullopt, e.what()});
                return;
            }
        }

        switch (reg_->Bind(hello.identity, chan, hello.resume_token))
        {
        case BindOutcome::Taken:
            SendWelcome(chan, JoinResult{JoinStatus::Duplicate, std::nullopt,
                                         std::format("'{}' is already connected", hello.identity)});
            return;
        case BindOutcome::Refused:
            std::print("[Server] {} tried to reclaim a seat without its resume token\n", hello.identity);
            SendWelcome(chan, JoinResult{JoinStatus::Unauthorized, std::nullopt,
                                         std::format("'{}' needs its resume token to reconnect", hello.identity)});
            return;
        case BindOutcome::Reclaimed:
        {
            chan->identity = hello.identity;
            std::optional<Role> inherited;
            std::string token;
            {
                std::lock_guard<std::mutex> lock(chan->mtx);
                inherited = chan->role;
                token = chan->resume_token;
            }
            std::print("[Server] {} reconnected as {}\n", hello.identity, ToString(*inherited));
            SendWelcome(chan, JoinResult{JoinStatus::Accepted, inherited, "reconnected"}, token);
            return;
        }
        case BindOutcome::Fresh:
            break;
        }
        chan->identity = hello.identity;

        JoinRequest req{hello.identity, creds};
        std::future<JoinResult> pending = join_(std::move(req));

        // the lobby answers from the engine thread; keep the network thread free
        std::thread([chan, reg = reg_, pending = std::move(pending)]() mutable
        {
            JoinResult res{JoinStatus::Closed, std::nullopt, "registration is closed"};
            try
            {
                res = pending.get();
            }
            catch (std::future_error const& e)
            {
                std::print("[Server] join of {} abandoned: {}\n", chan->identity, e.what());
            }

            std::string token;
            if (res.Accepted())
            {
                token = NewResumeToken();
                std::lock_guard<std::mutex> lock(chan->mtx);
                chan->role = res.role;
                chan->resume_token = token;
            }
            else
            {
                reg->Unbind(chan->identity, chan);
            }
            SendWelcome(chan, res, token);
        }).detach();
    }
}
