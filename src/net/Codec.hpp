//
// Codec.hpp: FlatBuffers framing of join handshakes, requests and replies
//

#ifndef LUPUS_CODEC_HPP
#define LUPUS_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <variant>

#include <flatbuffers/flatbuffers.h>

#include "../core/Lobby.hpp"
#include "../core/Message.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/lupus_net_generated.h"

namespace lupus::core::net
{
    struct ParseError
    {
        std::string message;
    };

    struct HelloFrame
    {
        Identity identity;
        std::string session;
        std::string timestamp;
        std::string signature;
        std::string resume_token;
    };

    struct WelcomeFrame
    {
        JoinResult result;
        std::string resume_token;
    };

    struct RequestFrame
    {
        std::uint64_t request_id{};
        Message msg;
    };

    struct ReplyFrame
    {
        std::uint64_t request_id{};
        Message msg;
    };

    using Frame = std::variant<HelloFrame, WelcomeFrame, RequestFrame, ReplyFrame>;

    auto ToFbKind(MessageKind k) noexcept -> lupus::gen::net::Kind;
    auto FromFbKind(lupus::gen::net::Kind k) noexcept -> MessageKind;
    auto ToFbStatus(JoinStatus s) noexcept -> lupus::gen::net::JoinStatus;
    auto FromFbStatus(lupus::gen::net::JoinStatus s) noexcept -> JoinStatus;

    // --- Outbound builders ---

    auto BuildHello(HelloFrame const& hello) -> flatbuffers::DetachedBuffer;
    auto BuildWelcome(JoinResult const& result, std::string const& resume_token = {}) -> flatbuffers::DetachedBuffer;
    auto BuildRequest(std::uint64_t request_id, Message const& msg) -> flatbuffers::DetachedBuffer;
    auto BuildReply(std::uint64_t request_id, Message const& msg) -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified; never trusts the buffer) ---

    auto DecodeFrame(std::span<std::byte const> bytes) -> std::expected<Frame, ParseError>;
} // namespace lupus::core::net

#endif //LUPUS_CODEC_HPP
