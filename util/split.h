#pragma once

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

template <typename S, typename R = S>
std::vector<R> SplitString(const S& s, const typename S::value_type ch) {
    std::vector<R> parts;
    auto sp = s.begin();
    for (auto si = s.begin(); si != s.end(); ++si) {
        if (*si == ch) {
            if (sp < si) {
                parts.emplace_back(sp, si);
            }
            sp = si + 1;
        }
    }
    if (sp != s.end()) {
        parts.emplace_back(sp, s.end());
    }
    return parts;
}

inline std::vector<std::string_view> SplitPath(const std::string_view s, const char ch = '/') {
    return SplitString<std::string_view>(s, ch);
}

/**
 * Splits the string at the first occurrence of the separator.
 *
 * @return head and tail of the string or nothing if there is no separator.
 */
inline std::optional<std::pair<std::string_view, std::string_view>> SplitOnce(
    const std::string_view s, const std::string_view sep
) {
    if (const size_t pos = s.find(sep); pos != std::string_view::npos) {
        return std::make_pair(s.substr(0, pos), s.substr(pos + sep.size()));
    }
    return std::nullopt;
}
