#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace prism::text {

/// Strip leading and trailing whitespace
[[nodiscard]] inline std::string_view trim(std::string_view s) {
    std::size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    std::size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

[[nodiscard]] inline std::string to_uppercase(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

[[nodiscard]] inline std::string to_lowercase(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

}  // namespace prism::text
