//
// Message.hpp: protocol message exchanged between moderator and participants
//

#ifndef LUPUS_MESSAGE_HPP
#define LUPUS_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "Types.hpp"

namespace lupus::core
{
    enum class MessageKind : uint8_t
    {
        Register = 0,
        SystemNotice,
        Response,
        ImportantInfo,
        // night
        NightKill,
        Divine,
        Save,
        Poison,
        // day
        DayDiscuss,
        DayVote,
        // two-sided sub-games
        Move
    };

    struct Message
    {
        MessageKind kind{MessageKind::SystemNotice};
        Identity source;
        std::string content;
    };

    inline auto MakeResponse(Identity source, std::string content) -> Message
    {
        return Message{MessageKind::Response, std::move(source), std::move(content)};
    }

    inline auto ToString(MessageKind k) noexcept -> std::string_view
    {
        switch (k)
        {
        case MessageKind::Register: return "register";
        case MessageKind::SystemNotice: return "system_notice";
        case MessageKind::Response: return "response";
        case MessageKind::ImportantInfo: return "important_info";
        case MessageKind::NightKill: return "night_kill";
        case MessageKind::Divine: return "divine";
        case MessageKind::Save: return "save";
        case MessageKind::Poison: return "poison";
        case MessageKind::DayDiscuss: return "day_discuss";
        case MessageKind::DayVote: return "day_vote";
        case MessageKind::Move: return "move";
        }
        return "unknown";
    }

    // Accepts both "system_notice" and "system-notice".
    inline auto KindFromString(std::string_view s) -> std::optional<MessageKind>
    {
        for (uint8_t i = 0; i <= static_cast<uint8_t>(MessageKind::Move); ++i)
        {
            auto const k = static_cast<MessageKind>(i);
            std::string_view const name = ToString(k);
            if (name.size() != s.size()) continue;

            bool same = true;
            for (std::size_t j{}; j < s.size() && same; ++j)
            {
                char const c = s[j] == '-' ? '_' : s[j];
                same = c == name[j];
            }
            if (same) return k;
        }
        return std::nullopt;
    }
}

#endif //LUPUS_MESSAGE_HPP
