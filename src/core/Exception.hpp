//
// Exception.hpp: error codes, typed exceptions and throw helpers
//

#ifndef LUPUS_EXCEPTION_HPP
#define LUPUS_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace lupus::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Config, // missing/invalid startup configuration
        State, // engine misuse (wrong phase, unknown participant)
        Delivery, // transport could not complete a round-trip
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    // Thrown by transports; Messenger turns it into a DeliveryFailure.
    struct DeliveryError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Config: throw ConfigError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::Delivery: throw DeliveryError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define LPS_THROW(code_enum, msg) ::lupus::core::error::fail((code_enum), (msg))
#define LPS_ASSERT(cond, msg) do { if(!(cond)) ::lupus::core::error::fail(::lupus::core::error::Code::Assertion, (msg)); } while(0)

    // Join-gating failures; always fatal to the join attempt.
    enum class AuthFailure : std::uint8_t
    {
        Unauthorized, // signature, timestamp or agent id missing
        InvalidTimestamp,
        TokenExpired,
        NotAuthorized, // agent lacks on-chain permission for the session
        InvalidSignature
    };

    struct AuthorizationError : public OmegaException<AuthFailure>
    {
        using OmegaException<AuthFailure>::OmegaException;
    };

    inline auto to_string(AuthFailure f) -> std::string_view
    {
        switch (f)
        {
        case AuthFailure::Unauthorized: return "Unauthorized";
        case AuthFailure::InvalidTimestamp: return "Invalid timestamp";
        case AuthFailure::TokenExpired: return "Token expired";
        case AuthFailure::NotAuthorized: return "No auth on chain";
        case AuthFailure::InvalidSignature: return "Invalid signature";
        }
        return "Unknown";
    }
}

#endif //LUPUS_EXCEPTION_HPP
