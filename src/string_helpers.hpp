#pragma once

#include <algorithm>
#include <string_view>

namespace tagden {

inline char ascii_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// ASCII case-insensitive comparison
inline bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return ascii_lower(x) == ascii_lower(y); });
}

inline bool ends_with_ignore_case(std::string_view text, std::string_view suffix) noexcept {
    return suffix.size() <= text.size() &&
           equals_ignore_case(text.substr(text.size() - suffix.size()), suffix);
}

} // namespace tagden
