#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace retryable {

inline std::string ToLower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char cha : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(cha))));
    }
    return lower;
}

inline std::string ToUpper(std::string_view str) {
    std::string upper;
    upper.reserve(str.size());
    for (char cha : str) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(cha))));
    }
    return upper;
}

inline std::string TrimCopy(std::string_view str) {
    auto begin = str.find_first_not_of(" \t\n\v\f\r");
    if (begin == std::string_view::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t\n\v\f\r");
    return std::string(str.substr(begin, end - begin + 1));
}

// Splits "key <delimiter> value" at the first delimiter, trimming both sides.
inline std::optional<std::pair<std::string, std::string>> SplitKeyValue(std::string_view line, char delimiter = '=') {
    auto pos = line.find(delimiter);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(TrimCopy(line.substr(0, pos)), TrimCopy(line.substr(pos + 1)));
}

} // namespace retryable
