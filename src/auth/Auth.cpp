//
// Auth.cpp
//

#include "Auth.hpp"

#include <charconv>
#include <cstdint>
#include <format>
#include <print>
#include <utility>

#include "../core/Util.hpp"

namespace lupus::core::auth
{
    namespace
    {
        [[noreturn]]
        auto Deny(error::AuthFailure f, std::string msg) -> void
        {
            throw error::AuthorizationError(std::move(msg), f);
        }
    }

    auto VerifyAuth(ChainClient const& client,
                    std::string_view const session,
                    Credentials const& creds,
                    std::chrono::system_clock::time_point const now) -> void
    {
        using error::AuthFailure;

        if (creds.signature.empty() || creds.timestamp.empty() || creds.agent.empty())
        {
            Deny(AuthFailure::Unauthorized, "Unauthorized");
        }

        int64_t ts{};
        std::string_view const raw = creds.timestamp;
        auto const res = std::from_chars(raw.data(), raw.data() + raw.size(), ts);
        if (res.ec != std::errc{} || res.ptr != raw.data() + raw.size() || ts < 0)
        {
            Deny(AuthFailure::InvalidTimestamp, std::format("Invalid timestamp '{}'", raw));
        }

        int64_t const now_s = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        // ts is remote input; keep the arithmetic on the server side
        if (ts < now_s - constants::TokenLifetime.count())
        {
            std::print("[Auth] {} has expired token\n", creds.agent);
            Deny(AuthFailure::TokenExpired, "Token expired");
        }

        if (!client.HasAuth(session, creds.agent))
        {
            std::print("[Auth] {} is not auth on chain\n", creds.agent);
            Deny(AuthFailure::NotAuthorized, std::format("{} has no permission for session {}", creds.agent, session));
        }

        std::string const address = client.GetAgent(creds.agent);
        // the signed message is the decimal timestamp
        if (!client.ValidSignature(std::to_string(ts), creds.signature, address))
        {
            std::print("[Auth] {} has invalid signature\n", creds.agent);
            Deny(AuthFailure::InvalidSignature, "Invalid signature");
        }
    }

    auto EncodeCredentials(Credentials const& creds) -> std::string
    {
        return std::format("agent_id={};timestamp={};signature={}", creds.agent, creds.timestamp, creds.signature);
    }

    auto DecodeCredentials(std::string_view const text) -> Credentials
    {
        Credentials out{};
        for (std::string const& field : util::SplitList(text, ';'))
        {
            auto const eq = field.find('=');
            if (eq == std::string::npos) continue;

            std::string const key = util::Normalize(std::string_view(field).substr(0, eq));
            std::string value{util::Trim(std::string_view(field).substr(eq + 1))};

            if (key == "agent_id") out.agent = std::move(value);
            else if (key == "timestamp") out.timestamp = std::move(value);
            else if (key == "signature") out.signature = std::move(value);
        }
        return out;
    }

    Gate::Gate(std::shared_ptr<ChainClient const> client, std::string session) :
        client_{std::move(client)},
        session_{std::move(session)}
    {
        if (!client_)
        {
            LPS_THROW(error::Code::Config, "auth gate needs a chain client");
        }
        if (session_.empty())
        {
            LPS_THROW(error::Code::Config, "auth gate needs a session id");
        }
    }

    auto Gate::Check(Credentials const& creds) const -> void
    {
        VerifyAuth(*client_, session_, creds);
    }
}
