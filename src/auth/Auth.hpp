//
// Auth.hpp: join gating against an on-chain permission registry
//

#ifndef LUPUS_AUTH_HPP
#define LUPUS_AUTH_HPP

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace lupus::core::auth
{
    // The chain collaborator. Implementations talk to a node; tests mock it.
    class ChainClient
    {
    public:
        virtual ~ChainClient() = default;

        virtual auto HasAuth(std::string_view session, std::string_view agent) const -> bool = 0;
        // Wallet address registered for agent ("" if none)
        virtual auto GetAgent(std::string_view agent) const -> std::string = 0;
        // True if signature over message was produced by address
        virtual auto ValidSignature(std::string_view message,
                                    std::string_view signature,
                                    std::string_view address) const -> bool = 0;
    };

    struct Credentials
    {
        Identity agent;
        std::string timestamp; // unix seconds, base 10
        std::string signature;
    };

    // Throws error::AuthorizationError. Checks run in this order:
    // missing field, timestamp format, expiry (> 300s old), permission, signature.
    auto VerifyAuth(ChainClient const& client,
                    std::string_view session,
                    Credentials const& creds,
                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) -> void;

    // "agent_id=<id>;timestamp=<ts>;signature=<sig>" carried as register content.
    auto EncodeCredentials(Credentials const& creds) -> std::string;
    // Unknown keys are ignored; missing keys stay empty.
    auto DecodeCredentials(std::string_view text) -> Credentials;

    // Binds a client to the session being played.
    class Gate
    {
    public:
        Gate(std::shared_ptr<ChainClient const> client, std::string session);

        auto Check(Credentials const& creds) const -> void;
        auto Session() const noexcept -> std::string const& { return session_; }

    private:
        std::shared_ptr<ChainClient const> client_;
        std::string session_;
    };
}

#endif //LUPUS_AUTH_HPP
