//
// WsTransport.hpp: server-side Transport over WebSocket++ (one connection per participant)
//

#ifndef LUPUS_WSTRANSPORT_HPP
#define LUPUS_WSTRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "../auth/Auth.hpp"
#include "../core/LocalTransport.hpp"
#include "../core/Lobby.hpp"
#include "../core/Transport.hpp"
#include "Codec.hpp"

namespace lupus::core::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // One remote participant. Requests go out as frames; replies are matched by request id.
    struct Channel
    {
        std::weak_ptr<WsServer>          ep;
        Hdl                              hdl;
        Identity                         identity; // empty until Hello is accepted
        std::optional<Role>              role;
        std::string                      resume_token; // issued with the accepting Welcome

        std::mutex                       mtx;
        std::condition_variable          cv;
        std::map<std::uint64_t, std::optional<Message>> waiting;
        bool                             connected{false};

        void Expect(std::uint64_t id);
        // Drops replies nobody waits for (late or unsolicited).
        void Deliver(std::uint64_t id, Message msg);
        bool WaitReplyUntil(std::uint64_t id, Message& out, std::chrono::steady_clock::time_point deadline);
        void Disconnect();
        bool SendBinary(std::span<std::uint8_t const> bytes);
    };

    enum class BindOutcome : std::uint8_t
    {
        Fresh,     // nobody held the identity; the join goes to the lobby
        Reclaimed, // a dropped seat was taken back with its resume token
        Taken,     // another live connection holds the identity
        Refused    // a dropped seat, but the resume token did not match
    };

    // Connection bookkeeping; shared with the join workers so they never touch the transport itself.
    struct ChannelRegistry
    {
        mutable std::mutex mtx;
        std::map<Hdl, std::shared_ptr<Channel>, std::owner_less<Hdl>> by_hdl;
        std::map<Identity, std::shared_ptr<Channel>> by_identity; // lowercased keys

        auto Find(Identity const& identity) const -> std::shared_ptr<Channel>;
        auto Bind(Identity const& identity, std::shared_ptr<Channel> const& chan, std::string const& resume_token)
            -> BindOutcome;
        auto Unbind(Identity const& identity, std::shared_ptr<Channel> const& chan) -> void;
    };

    class WsTransport final : public Transport
    {
    public:
        using JoinHandler = std::function<std::future<JoinResult>(JoinRequest)>;

        // `session` must match each Hello's session field. A gate, when given, also
        // vets reconnects (fresh joins are vetted by the lobby).
        WsTransport(std::uint16_t port, std::string session, std::shared_ptr<auth::Gate const> gate = nullptr);
        ~WsTransport() override;

        WsTransport(WsTransport const&) = delete;
        auto operator=(WsTransport const&) -> WsTransport& = delete;

        // Where accepted Hellos go (normally GameEngine::Join). Set before Start().
        auto OnJoin(JoinHandler handler) -> void;

        auto Start() -> void;
        auto Stop() -> void;

        // Agents registered here are hosted in-process (the moderator).
        auto Register(Identity const& identity, AgentFactory factory) -> void override;

        auto Send(Message const& msg,
                  Identity const& recipient,
                  Identity const& sender,
                  std::chrono::steady_clock::time_point deadline) -> Message override;

        auto ConnectedCount() const -> std::size_t;

    private:
        auto HandleOpen(Hdl hdl) -> void;
        auto HandleClose(Hdl hdl) -> void;
        auto HandleMessage(Hdl hdl, WsServer::message_ptr msg) -> void;
        auto HandleHello(std::shared_ptr<Channel> const& chan, HelloFrame hello) -> void;


    private:
        std::uint16_t port_;
        std::string session_;
        std::shared_ptr<auth::Gate const> gate_;
        JoinHandler join_;

        std::shared_ptr<WsServer> server_;
        std::thread net_thr_;
        bool running_{false};

        LocalTransport local_;
        std::atomic<std::uint64_t> next_request_id_{1};

        std::shared_ptr<ChannelRegistry> reg_;
    };
}

#endif // LUPUS_WSTRANSPORT_HPP
