/**
 * @file string_utils.hpp
 * @brief String helpers shared by the extractors, parsers and campaign engine
 *
 * Line splitting, trimming, case-insensitive pattern matching and address
 * recognition used when turning free-form oracle text and tool output into
 * commands and findings.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace redeyes {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * for (const auto& line : StringUtils::SplitLines(oracle_text)) {
 *     auto trimmed = StringUtils::Trim(line);
 *     if (StringUtils::ContainsAnyIgnoreCase(trimmed, {"rm -rf", "mkfs"})) {
 *         continue;
 *     }
 * }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /// Remove leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// ASCII lowercase copy
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split text into lines
     *
     * Handles both `\n` and `\r\n` endings. Empty lines are preserved so that
     * callers can track block boundaries.
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    /// Split by any run of whitespace (empty tokens dropped)
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /// First whitespace-delimited token, or empty string
    static std::string FirstToken(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);

    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Pattern Matching
     ***************************************************************************/

    /// Case-insensitive substring test
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /**
     * @brief Case-insensitive test against a list of substrings
     *
     * @param str Haystack
     * @param patterns Needles (empty needles are ignored)
     * @return The first matching pattern, or empty string when none matched
     */
    static std::string FindAnyIgnoreCase(const std::string& str,
                                         const std::vector<std::string>& patterns);

    static bool ContainsAnyIgnoreCase(const std::string& str,
                                      const std::vector<std::string>& patterns);

    /// Dotted-quad IPv4 address
    static bool IsIPAddress(const std::string& str);

    /// DNS hostname with at least one dot (e.g. "mail.example.com")
    static bool IsHostname(const std::string& str);

    /***************************************************************************
     * Display Helpers
     ***************************************************************************/

    /**
     * @brief Truncate string to a maximum length
     *
     * @param str Input string
     * @param max_length Maximum length including suffix
     * @param suffix Appended when truncation happens (default "...")
     *
     * Never cuts inside a multi-byte UTF-8 sequence.
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");

    /**
     * @brief Largest offset <= @p offset that starts a UTF-8 sequence
     */
    static std::size_t Utf8Boundary(const std::string& str, std::size_t offset);
};

} // namespace utils
} // namespace redeyes
