/// \file text.hpp
/// \brief Private string helpers shared by logx implementation files.

#ifndef LOGX_DETAIL_TEXT_HPP
#define LOGX_DETAIL_TEXT_HPP

#include <algorithm>
#include <cctype>
#include <format>
#include <string>
#include <string_view>

namespace logx::detail {

inline std::string_view trim(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n";
    auto first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos)
        return {};
    auto last = s.find_last_not_of(kSpace);
    return s.substr(first, last - first + 1);
}

inline char fold(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return fold(x) == fold(y); });
}

/// Case-insensitive substring search. An empty needle always matches.
inline bool icontains(std::string_view haystack, std::string_view needle) {
    if (needle.empty())
        return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char x, char y) { return fold(x) == fold(y); });
    return it != haystack.end();
}

/// Shortest round-trippable text for a number: 10 -> "10", 0.5 -> "0.5".
inline std::string format_number(double value) {
    return std::format("{}", value);
}

} // namespace logx::detail

#endif // LOGX_DETAIL_TEXT_HPP
