//
// Util.hpp: small text helpers shared by roster, tally and codec
//

#ifndef LUPUS_UTIL_HPP
#define LUPUS_UTIL_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace lupus::core::util
{
    inline auto ToLower(std::string_view s) -> std::string
    {
        std::string out(s);
        std::ranges::transform(out, out.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    inline auto Trim(std::string_view s) -> std::string_view
    {
        auto const is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    // trim + case-fold
    inline auto Normalize(std::string_view s) -> std::string
    {
        return ToLower(Trim(s));
    }

    inline auto EqualsCaseless(std::string_view a, std::string_view b) -> bool
    {
        return a.size() == b.size() &&
            std::ranges::equal(a, b, [](unsigned char x, unsigned char y)
            {
                return std::tolower(x) == std::tolower(y);
            });
    }

    inline auto Join(std::vector<std::string> const& parts, std::string_view sep) -> std::string
    {
        std::string out;
        for (std::size_t i{}; i < parts.size(); ++i)
        {
            if (i) out += sep;
            out += parts[i];
        }
        return out;
    }

    // Whole-string decimal; nullopt on junk or when the value does not fit T
    template <class T>
    auto ParseNumber(std::string_view s) -> std::optional<T>
    {
        T out{};
        auto const res = std::from_chars(s.data(), s.data() + s.size(), out);
        if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return std::nullopt;
        return out;
    }

    // "a, b ,c" -> {"a","b","c"}; empty items dropped
    inline auto SplitList(std::string_view s, char sep = ',') -> std::vector<std::string>
    {
        std::vector<std::string> out;
        for (auto const part : std::views::split(s, sep))
        {
            std::string_view const item = Trim(std::string_view(part.begin(), part.end()));
            if (!item.empty()) out.emplace_back(item);
        }
        return out;
    }
}

#endif //LUPUS_UTIL_HPP
