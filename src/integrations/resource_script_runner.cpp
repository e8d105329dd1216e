/**
 * @file resource_script_runner.cpp
 * @brief Resource-file generation and console invocation
 *
 * @date 2025
 */

#include "redeyes/integrations/resource_script_runner.hpp"
#include "redeyes/utils/hash_utils.hpp"
#include "redeyes/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace redeyes {
namespace integrations {

using utils::HashUtils;
using utils::StringUtils;

ResourceScriptRunner::ResourceScriptRunner(const core::SafeExecutor& executor, const Config& config)
    : executor_(executor)
    , config_(config) {
}

bool ResourceScriptRunner::IsFrameworkCommand(const std::string& command) {
    return StringUtils::StartsWith(command, "use ") ||
           StringUtils::ContainsIgnoreCase(command, "metasploit");
}

std::string ResourceScriptRunner::GenerateScript(const std::string& command,
                                                 const std::string& target) const {
    std::ostringstream script;
    script << command << "\n";

    if (StringUtils::Contains(command, "use ")) {
        script << "set RHOSTS " << target << "\n";
        script << "set LHOST " << config_.lhost << "\n";
        script << "check\n";
        script << "exploit -j\n";
    }

    script << "exit\n";
    return script.str();
}

ConsoleResult ResourceScriptRunner::Run(const std::string& command,
                                        const std::string& target,
                                        const std::filesystem::path& scripts_directory,
                                        const std::optional<std::filesystem::path>& output_path) const {
    ConsoleResult result;

    if (auto pattern = executor_.FindBlockedPattern(command)) {
        spdlog::warn("🛑 Refusing to script blocked pattern '{}': {}", *pattern, command);
        result.envelope.exit_code = core::kExitBlocked;
        result.envelope.stderr_output = "Blocked catastrophic pattern in command";
        result.envelope.error = "blocked: catastrophic pattern '" + *pattern + "'";
        return result;
    }

    result.script_path = scripts_directory /
        ("msf_resource_" + HashUtils::ShortDigest(target + "\n" + command) + ".rc");

    try {
        std::filesystem::create_directories(scripts_directory);

        std::ofstream file(result.script_path, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open " + result.script_path.string());
        }
        file << GenerateScript(command, target);
        if (!file.good()) {
            throw std::runtime_error("short write to " + result.script_path.string());
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Failed to write resource script: {}", e.what());
        result.envelope.exit_code = core::kExitSpawnFailure;
        result.envelope.error = std::string("resource script: ") + e.what();
        return result;
    }

    spdlog::debug("[MSF] {} -> {}", command, result.script_path.string());

    std::vector<std::string> argv{config_.console_binary, "-r", result.script_path.string(), "-q"};
    result.envelope = executor_.Execute(argv, scripts_directory, config_.timeout,
                                        config_.max_output_bytes, output_path);
    result.outcome = ParseOutput(result.envelope.stdout_output);

    if (!result.outcome.sessions.empty()) {
        spdlog::info("Console reported {} session(s) for {}", result.outcome.sessions.size(), target);
    }

    return result;
}

ConsoleOutcome ResourceScriptRunner::ParseOutput(const std::string& output) {
    ConsoleOutcome outcome;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw);
        if (line.empty()) {
            continue;
        }

        if (StringUtils::ContainsIgnoreCase(line, "session") &&
            StringUtils::ContainsIgnoreCase(line, "opened")) {
            outcome.sessions.push_back(line);
        }
        if (StringUtils::ContainsIgnoreCase(line, "The target is vulnerable") ||
            StringUtils::ContainsIgnoreCase(line, "The target appears to be vulnerable")) {
            outcome.target_vulnerable = true;
        }
        if (StringUtils::StartsWith(line, "[-]")) {
            outcome.errors.push_back(line);
        }
    }

    return outcome;
}

} // namespace integrations
} // namespace redeyes
