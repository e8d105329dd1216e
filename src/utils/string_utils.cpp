/**
 * @file string_utils.cpp
 * @brief Implementation of shared string helpers
 *
 * @date 2025
 */

#include "redeyes/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace redeyes {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(text);

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    return lines;
}

std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

std::string StringUtils::FirstToken(const std::string& str) {
    std::istringstream iss(str);
    std::string token;
    iss >> token;
    return token;
}

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

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// PATTERN MATCHING UTILITIES
// ============================================================================

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    if (substring.empty()) {
        return false;
    }
    return ToLower(str).find(ToLower(substring)) != std::string::npos;
}

std::string StringUtils::FindAnyIgnoreCase(const std::string& str,
                                           const std::vector<std::string>& patterns) {
    const std::string lower = ToLower(str);
    for (const auto& pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        if (lower.find(ToLower(pattern)) != std::string::npos) {
            return pattern;
        }
    }
    return "";
}

bool StringUtils::ContainsAnyIgnoreCase(const std::string& str,
                                        const std::vector<std::string>& patterns) {
    return !FindAnyIgnoreCase(str, patterns).empty();
}

bool StringUtils::IsIPAddress(const std::string& str) {
    static const std::regex ipv4_pattern(
        R"(^(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)"
    );
    return std::regex_match(str, ipv4_pattern);
}

bool StringUtils::IsHostname(const std::string& str) {
    static const std::regex hostname_pattern(
        R"(^([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}$)"
    );
    return str.size() <= 253 && std::regex_match(str, hostname_pattern);
}

// ============================================================================
// DISPLAY HELPERS
// ============================================================================

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, Utf8Boundary(str, max_length));
    }

    return str.substr(0, Utf8Boundary(str, max_length - suffix.length())) + suffix;
}

std::size_t StringUtils::Utf8Boundary(const std::string& str, std::size_t offset) {
    if (offset >= str.size()) {
        return str.size();
    }
    // Back up over continuation bytes (10xxxxxx)
    while (offset > 0 &&
           (static_cast<unsigned char>(str[offset]) & 0xC0) == 0x80) {
        --offset;
    }
    return offset;
}

} // namespace utils
} // namespace redeyes
