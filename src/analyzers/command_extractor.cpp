/**
 * @file command_extractor.cpp
 * @brief Implementation of the general and exploit command extractors
 *
 * **Fences**: a line starting with ```` ``` ```` opens a block (any language
 * tag after it is ignored) and the next such line closes it.
 *
 * @date 2025
 */

#include "redeyes/analyzers/command_extractor.hpp"
#include "redeyes/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace redeyes {
namespace analyzers {

using utils::StringUtils;

namespace {

// std::regex backtracks recursively; keep matched lines short
constexpr std::size_t kMaxCandidateLength = 4096;

bool IsFenceLine(const std::string& trimmed_line) {
    return StringUtils::StartsWith(trimmed_line, "```");
}

// Insert-if-new while keeping first-seen order
void AddUnique(std::vector<std::string>& ordered,
               std::set<std::string>& seen,
               const std::string& command) {
    if (seen.insert(command).second) {
        ordered.push_back(command);
    }
}

} // anonymous namespace

// ============================================================================
// COMMAND EXTRACTOR
// ============================================================================

CommandExtractor::CommandExtractor()
    : CommandExtractor(ExtractorConfig{}) {
}

CommandExtractor::CommandExtractor(const ExtractorConfig& config)
    : config_(config) {
}

bool CommandExtractor::IsCommentLine(const std::string& trimmed_line) {
    return StringUtils::StartsWith(trimmed_line, "#") ||
           StringUtils::StartsWith(trimmed_line, "//");
}

std::vector<std::string> CommandExtractor::FencedLines(const std::string& text) {
    std::vector<std::string> lines;
    std::vector<std::string> block;
    bool in_block = false;

    for (const auto& raw : StringUtils::SplitLines(text)) {
        std::string line = StringUtils::Trim(raw);

        if (IsFenceLine(line)) {
            if (in_block) {
                lines.insert(lines.end(), block.begin(), block.end());
                block.clear();
            }
            in_block = !in_block;
            continue;
        }

        if (in_block && !line.empty() && !IsCommentLine(line)) {
            block.push_back(line);
        }
    }

    // An unterminated block contributes nothing
    return lines;
}

std::vector<std::string> CommandExtractor::Extract(const std::string& text,
                                                   const std::set<std::string>& known_tools) const {
    std::vector<std::string> commands;
    std::set<std::string> seen;

    for (const auto& line : FencedLines(text)) {
        AddUnique(commands, seen, line);
    }

    for (const auto& raw : StringUtils::SplitLines(text)) {
        std::string line = StringUtils::Trim(raw);
        if (line.empty() || IsCommentLine(line)) {
            continue;
        }

        std::string tool = StringUtils::FirstToken(line);
        if (known_tools.count(tool) > 0 || config_.allow_list.count(tool) > 0) {
            AddUnique(commands, seen, line);
        }
    }

    if (commands.size() > config_.max_commands) {
        commands.resize(config_.max_commands);
    }

    spdlog::debug("Extracted {} candidate commands", commands.size());
    return commands;
}

// ============================================================================
// EXPLOIT COMMAND EXTRACTOR
// ============================================================================

ExploitCommandExtractor::ExploitCommandExtractor()
    : ExploitCommandExtractor(ExploitExtractorConfig{}) {
}

ExploitCommandExtractor::ExploitCommandExtractor(const ExploitExtractorConfig& config)
    : config_(config) {
    const auto flags = std::regex::ECMAScript | std::regex::icase;

    // Framework module selection, parameters and run verbs
    candidate_patterns_.emplace_back(R"(^use\s+\S+.*$)", flags);
    candidate_patterns_.emplace_back(R"(^set\s+\S+\s+\S+.*$)", flags);
    candidate_patterns_.emplace_back(R"(^(exploit|run)(\s+-.*)?$)", flags);
    candidate_patterns_.emplace_back(R"(^msfconsole(\s+.*)?$)", flags);
    candidate_patterns_.emplace_back(R"(^msfvenom\s+.+$)", flags);

    // Credential attacks
    candidate_patterns_.emplace_back(R"(^(hydra|john|hashcat)\s+.+$)", flags);
    candidate_patterns_.emplace_back(R"(^sqlmap\s+.*--dump.*$)", flags);

    // Remote shells
    candidate_patterns_.emplace_back(R"(^(ssh|telnet)\s+.+$)", flags);
}

bool ExploitCommandExtractor::IsCandidate(const std::string& trimmed_line) const {
    if (trimmed_line.size() > kMaxCandidateLength) {
        return false;
    }
    for (const auto& pattern : candidate_patterns_) {
        if (std::regex_match(trimmed_line, pattern)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ExploitCommandExtractor::Extract(const std::string& text) const {
    std::vector<std::string> commands;
    std::set<std::string> seen;

    for (const auto& line : CommandExtractor::FencedLines(text)) {
        if (IsCandidate(line)) {
            AddUnique(commands, seen, line);
        }
    }

    for (const auto& raw : StringUtils::SplitLines(text)) {
        std::string line = StringUtils::Trim(raw);
        if (line.empty() || CommandExtractor::IsCommentLine(line)) {
            continue;
        }
        if (IsCandidate(line)) {
            AddUnique(commands, seen, line);
        }
    }

    if (commands.size() > config_.max_commands) {
        commands.resize(config_.max_commands);
    }

    spdlog::debug("Extracted {} exploit candidates", commands.size());
    return commands;
}

bool ExploitCommandExtractor::IsDestructive(const std::string& command) const {
    return StringUtils::ContainsAnyIgnoreCase(command, config_.destructive_patterns);
}

} // namespace analyzers
} // namespace redeyes
