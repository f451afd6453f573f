//
// Codec.cpp
//
#include "Codec.hpp"

#include <optional>
#include <utility>

namespace lupus::core::net
{
    namespace fb = lupus::gen::net;

    auto ToFbKind(MessageKind const k) noexcept -> fb::Kind
    {
        switch (k)
        {
        case MessageKind::Register: return fb::Kind::Register;
        case MessageKind::SystemNotice: return fb::Kind::SystemNotice;
        case MessageKind::Response: return fb::Kind::Response;
        case MessageKind::ImportantInfo: return fb::Kind::ImportantInfo;
        case MessageKind::NightKill: return fb::Kind::NightKill;
        case MessageKind::Divine: return fb::Kind::Divine;
        case MessageKind::Save: return fb::Kind::Save;
        case MessageKind::Poison: return fb::Kind::Poison;
        case MessageKind::DayDiscuss: return fb::Kind::DayDiscuss;
        case MessageKind::DayVote: return fb::Kind::DayVote;
        case MessageKind::Move: return fb::Kind::Move;
        }
        return fb::Kind::SystemNotice;
    }

    auto FromFbKind(fb::Kind const k) noexcept -> MessageKind
    {
        switch (k)
        {
        case fb::Kind::Register: return MessageKind::Register;
        case fb::Kind::SystemNotice: return MessageKind::SystemNotice;
        case fb::Kind::Response: return MessageKind::Response;
        case fb::Kind::ImportantInfo: return MessageKind::ImportantInfo;
        case fb::Kind::NightKill: return MessageKind::NightKill;
        case fb::Kind::Divine: return MessageKind::Divine;
        case fb::Kind::Save: return MessageKind::Save;
        case fb::Kind::Poison: return MessageKind::Poison;
        case fb::Kind::DayDiscuss: return MessageKind::DayDiscuss;
        case fb::Kind::DayVote: return MessageKind::DayVote;
        case fb::Kind::Move: return MessageKind::Move;
        }
        return MessageKind::SystemNotice;
    }

    auto ToFbStatus(JoinStatus const s) noexcept -> fb::JoinStatus
    {
        switch (s)
        {
        case JoinStatus::Accepted: return fb::JoinStatus::Accepted;
        case JoinStatus::Duplicate: return fb::JoinStatus::Duplicate;
        case JoinStatus::Full: return fb::JoinStatus::Full;
        case JoinStatus::Unauthorized: return fb::JoinStatus::Unauthorized;
        case JoinStatus::Closed: return fb::JoinStatus::Closed;
        }
        return fb::JoinStatus::Closed;
    }

    auto FromFbStatus(fb::JoinStatus const s) noexcept -> JoinStatus
    {
        switch (s)
        {
        case fb::JoinStatus::Accepted: return JoinStatus::Accepted;
        case fb::JoinStatus::Duplicate: return JoinStatus::Duplicate;
        case fb::JoinStatus::Full: return JoinStatus::Full;
        case fb::JoinStatus::Unauthorized: return JoinStatus::Unauthorized;
        case fb::JoinStatus::Closed: return JoinStatus::Closed;
        }
        return JoinStatus::Closed;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)lupus::core::MessageKind::Move == (int)lupus::gen::net::Kind::Move);
    static_assert((int)lupus::core::JoinStatus::Closed == (int)lupus::gen::net::JoinStatus::Closed);

    inline auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }
} // anonymous

namespace lupus::core::net
{
    static inline auto ToFbText(flatbuffers::FlatBufferBuilder& fbb, Message const& msg)
        -> flatbuffers::Offset<fb::TextMsg>
    {
        return fb::CreateTextMsgDirect(fbb, ToFbKind(msg.kind), msg.source.c_str(), msg.content.c_str());
    }

    static inline auto FromFbText(fb::TextMsg const* t) -> Message
    {
        return Message{FromFbKind(t->kind()), Str(t->source()), Str(t->content())};
    }

    template <class T>
    static auto Seal(flatbuffers::FlatBufferBuilder& fbb, fb::Payload type, flatbuffers::Offset<T> payload)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, type, payload.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Builders ----------

    auto BuildHello(HelloFrame const& hello) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const h = fb::CreateHelloDirect(fbb,
                                             /*schema_version*/ 1,
                                             hello.identity.c_str(),
                                             hello.session.c_str(),
                                             hello.timestamp.c_str(),
                                             hello.signature.c_str(),
                                             hello.resume_token.c_str());
        return Seal(fbb, fb::Payload::Hello, h);
    }

    auto BuildWelcome(JoinResult const& result, std::string const& resume_token) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        std::string const role = result.role ? std::string{ToString(*result.role)} : std::string{};
        auto const w = fb::CreateWelcomeDirect(fbb,
                                               ToFbStatus(result.status),
                                               role.c_str(),
                                               result.detail.c_str(),
                                               resume_token.c_str());
        return Seal(fbb, fb::Payload::Welcome, w);
    }

    auto BuildRequest(std::uint64_t const request_id, Message const& msg) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const text = ToFbText(fbb, msg);
        auto const r = fb::CreateRequest(fbb, request_id, text);
        return Seal(fbb, fb::Payload::Request, r);
    }

    auto BuildReply(std::uint64_t const request_id, Message const& msg) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const text = ToFbText(fbb, msg);
        auto const r = fb::CreateReply(fbb, request_id, text);
        return Seal(fbb, fb::Payload::Reply, r);
    }

    // ---------- Decode ----------

    auto DecodeFrame(std::span<std::byte const> const bytes) -> std::expected<Frame, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* raw = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(raw, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        fb::Envelope const* env = fb::GetEnvelope(raw);
        switch (env->payload_type())
        {
        case fb::Payload::Hello:
        {
            fb::Hello const* h = env->payload_as_Hello();
            if (h->schema_version() != 1)
                return std::unexpected(ParseError{"unsupported schema version"});
            if (Str(h->identity()).empty())
                return std::unexpected(ParseError{"hello without identity"});
            return HelloFrame{Str(h->identity()),
                              Str(h->session()),
                              Str(h->timestamp()),
                              Str(h->signature()),
                              Str(h->resume_token())};
        }
        case fb::Payload::Welcome:
        {
            fb::Welcome const* w = env->payload_as_Welcome();
            JoinResult res{FromFbStatus(w->status()), RoleFromString(Str(w->role())), Str(w->detail())};
            return WelcomeFrame{std::move(res), Str(w->resume_token())};
        }
        case fb::Payload::Request:
        {
            fb::Request const* r = env->payload_as_Request();
            if (!r->msg())
                return std::unexpected(ParseError{"request without message"});
            return RequestFrame{r->request_id(), FromFbText(r->msg())};
        }
        case fb::Payload::Reply:
        {
            fb::Reply const* r = env->payload_as_Reply();
            if (!r->msg())
                return std::unexpected(ParseError{"reply without message"});
            return ReplyFrame{r->request_id(), FromFbText(r->msg())};
        }
        case fb::Payload::NONE:
            break;
        }
        return std::unexpected(ParseError{"unknown payload"});
    }
}
