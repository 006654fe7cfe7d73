/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "sandpool/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace sandpool {
namespace utils {

// ============================================================================
// BASIC STRING MANIPULATION
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        token = Trim(token);
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ============================================================================
// VALUE PARSING
// ============================================================================

std::optional<bool> StringUtils::ParseBool(const std::string& str) {
    const std::string value = ToLower(Trim(str));

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<long long> StringUtils::ParseInt(const std::string& str) {
    const std::string value = Trim(str);
    if (value.empty()) {
        return std::nullopt;
    }

    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed, 10);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::map<std::string, std::string> StringUtils::ParseKeyValueList(const std::string& str,
                                                                  char separator) {
    std::map<std::string, std::string> result;

    for (const auto& entry : Split(str, ',')) {
        // Split on the last separator so "host:path" style keys survive
        auto pos = entry.rfind(separator);
        if (pos == std::string::npos || pos == 0 || pos + 1 >= entry.size()) {
            continue;
        }
        result[Trim(entry.substr(0, pos))] = Trim(entry.substr(pos + 1));
    }

    return result;
}

std::string StringUtils::Unquote(const std::string& str) {
    if (str.size() >= 2) {
        char first = str.front();
        char last = str.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return str.substr(1, str.size() - 2);
        }
    }
    return str;
}

} // namespace utils
} // namespace sandpool
