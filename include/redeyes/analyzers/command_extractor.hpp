/**
 * @file command_extractor.hpp
 * @brief Candidate command extraction from free-form oracle text
 *
 * Two extractors share one shape: pure functions from text to an ordered,
 * deduplicated, capped list of command strings. Neither ever executes
 * anything.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace redeyes {
namespace analyzers {

/**
 * @struct ExtractorConfig
 * @brief Allow-list and cap for general tool commands
 */
struct ExtractorConfig {
    /// First tokens accepted anywhere in the text, in addition to known tools
    std::set<std::string> allow_list{
        "dig", "ping", "curl", "wget", "nmap", "whois", "host", "nslookup"
    };
    std::size_t max_commands{10};
};

/**
 * @struct ExploitExtractorConfig
 * @brief Patterns and cap for exploitation candidates
 */
struct ExploitExtractorConfig {
    std::size_t max_commands{5};

    /// Case-insensitive substrings that disqualify an exploit candidate
    std::vector<std::string> destructive_patterns{
        "rm -rf", "format", "delete", "destroy"
    };
};

/**
 * @class CommandExtractor
 * @brief Turns oracle text into general tool commands
 *
 * **Algorithm**:
 * 1. Every fenced code block (optional language tag) is split into trimmed
 *    lines; blank lines and `#` / `//` comments are dropped.
 * 2. Every line of the whole text whose first token is a known tool or on the
 *    allow-list is a candidate.
 * 3. Deduplicate in first-seen order, then cap.
 *
 * **Usage Example**:
 * @code
 * CommandExtractor extractor;
 * auto commands = extractor.Extract(oracle_text, {"subfinder", "amass"});
 * @endcode
 */
class CommandExtractor {
public:
    explicit CommandExtractor(const ExtractorConfig& config);
    explicit CommandExtractor();

    /**
     * @brief Extract candidate commands
     * @param text Oracle response
     * @param known_tools Tool names considered available
     * @return At most max_commands unique commands, in first-seen order
     */
    std::vector<std::string> Extract(const std::string& text,
                                     const std::set<std::string>& known_tools) const;

    /**
     * @brief Non-comment lines of every fenced code block, in order
     */
    static std::vector<std::string> FencedLines(const std::string& text);

    /// true for lines starting with `#` or `//`
    static bool IsCommentLine(const std::string& trimmed_line);

    const ExtractorConfig& GetConfig() const { return config_; }

private:
    ExtractorConfig config_;
};

/**
 * @class ExploitCommandExtractor
 * @brief Stricter extractor for exploitation-framework and attack-tool syntax
 *
 * Accepts module selection (`use <module>`), parameter sets
 * (`set <NAME> <value>`), `exploit`/`run` with flags, `msfconsole`,
 * `msfvenom`, `hydra`, `john`, `hashcat`, `sqlmap ... --dump`, `ssh` and
 * `telnet`. IsDestructive() is a separate check that call sites apply
 * before execution.
 */
class ExploitCommandExtractor {
public:
    explicit ExploitCommandExtractor(const ExploitExtractorConfig& config);
    explicit ExploitCommandExtractor();

    std::vector<std::string> Extract(const std::string& text) const;

    /// true if the command contains a destructive pattern (case-insensitive)
    bool IsDestructive(const std::string& command) const;

    const ExploitExtractorConfig& GetConfig() const { return config_; }

private:
    bool IsCandidate(const std::string& trimmed_line) const;

    ExploitExtractorConfig config_;
    std::vector<std::regex> candidate_patterns_;
};

} // namespace analyzers
} // namespace redeyes
