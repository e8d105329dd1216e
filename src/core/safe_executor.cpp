/**
 * @file safe_executor.cpp
 * @brief Implementation of the safety-gated command executor
 *
 * **Execution Workflow**:
 * 1. **Deny-list**: reject catastrophic patterns before anything is spawned
 * 2. **Spawn**: /bin/sh -c for strings, execvp for argument vectors
 * 3. **Deadline**: process group killed when the timeout expires
 * 4. **Truncation**: stdout capped, marker appended
 * 5. **Persistence**: stdout plus a [stderr] section written to the output path
 *
 * @date 2025
 */

#include "redeyes/core/safe_executor.hpp"
#include "redeyes/utils/process_utils.hpp"
#include "redeyes/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace redeyes {
namespace core {

const char* const kTruncationMarker = "\n[...truncated...]\n";

using utils::ProcessUtils;
using utils::StringUtils;

SafeExecutor::SafeExecutor()
    : SafeExecutor(ExecutorConfig{}) {
}

SafeExecutor::SafeExecutor(const ExecutorConfig& config)
    : config_(config) {
    spdlog::debug("Safe Executor initialized ({} blocked patterns, default timeout {}s)",
                  config_.blocked_patterns.size(), config_.default_timeout.count());
}

ResultEnvelope SafeExecutor::Execute(const std::string& command,
                                     const std::filesystem::path& working_directory,
                                     std::chrono::seconds timeout,
                                     std::size_t max_output_bytes,
                                     const std::optional<std::filesystem::path>& output_path) const {
    return Run(ProcessUtils::ShellArgv(command), command, working_directory,
               timeout, max_output_bytes, output_path);
}

ResultEnvelope SafeExecutor::Execute(const std::vector<std::string>& argv,
                                     const std::filesystem::path& working_directory,
                                     std::chrono::seconds timeout,
                                     std::size_t max_output_bytes,
                                     const std::optional<std::filesystem::path>& output_path) const {
    return Run(argv, ProcessUtils::DescribeArgv(argv), working_directory,
               timeout, max_output_bytes, output_path);
}

ResultEnvelope SafeExecutor::Execute(const std::string& command,
                                     const std::filesystem::path& working_directory) const {
    return Execute(command, working_directory, config_.default_timeout,
                   config_.default_max_output_bytes);
}

std::optional<std::string> SafeExecutor::FindBlockedPattern(const std::string& command) const {
    auto match = StringUtils::FindAnyIgnoreCase(command, config_.blocked_patterns);
    if (match.empty()) {
        return std::nullopt;
    }
    return match;
}

// ============================================================================
// PRIVATE IMPLEMENTATION
// ============================================================================

ResultEnvelope SafeExecutor::Run(const std::vector<std::string>& argv,
                                 const std::string& description,
                                 const std::filesystem::path& working_directory,
                                 std::chrono::seconds timeout,
                                 std::size_t max_output_bytes,
                                 const std::optional<std::filesystem::path>& output_path) const {
    ResultEnvelope result;

    if (auto pattern = FindBlockedPattern(description)) {
        spdlog::warn("🛑 Blocked catastrophic pattern '{}' in command: {}", *pattern, description);
        result.success = false;
        result.exit_code = kExitBlocked;
        result.duration = std::chrono::milliseconds(0);
        result.stderr_output = "Blocked catastrophic pattern in command";
        result.error = "blocked: catastrophic pattern '" + *pattern + "'";
        return result;
    }

    if (config_.verbose_logging) {
        spdlog::debug("[EXEC] {} (timeout {}s)", description, timeout.count());
    }

    utils::ProcessSpec spec;
    spec.argv = argv;
    spec.working_directory = working_directory;
    spec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    spec.max_output_bytes = max_output_bytes;

    auto process = ProcessUtils::RunProcess(spec);
    result.duration = process.duration;

    if (process.spawn_failed) {
        spdlog::warn("Spawn failed for '{}': {}", description, process.error_message);
        result.success = false;
        result.exit_code = kExitSpawnFailure;
        result.stderr_output = process.error_message;
        result.error = process.error_message;
        return result;
    }

    if (process.timed_out) {
        spdlog::warn("⏱ Command timed out after {}s: {}", timeout.count(), description);
        result.success = false;
        result.exit_code = kExitTimeout;
        result.stderr_output = "Command timed out after " + std::to_string(timeout.count()) + "s";
        result.error = result.stderr_output;
        return result;
    }

    result.exit_code = process.exit_code;
    result.success = (process.exit_code == 0);
    result.stdout_output = std::move(process.stdout_output);
    result.stderr_output = std::move(process.stderr_output);

    if (process.stdout_truncated) {
        result.stdout_output += kTruncationMarker;
        result.truncated = true;
    }

    // The shell itself reports a missing binary in string-form commands
    if (result.exit_code == kExitSpawnFailure &&
        StringUtils::ContainsAnyIgnoreCase(result.stderr_output, {"not found"})) {
        result.error = "spawn failure: " +
                       StringUtils::Truncate(StringUtils::Trim(result.stderr_output), 200);
        spdlog::warn("Spawn failed for '{}': {}", description, *result.error);
    }

    if (output_path && !PersistOutput(*output_path, result)) {
        result.error = "failed to persist output to " + output_path->string();
    }

    return result;
}

bool SafeExecutor::PersistOutput(const std::filesystem::path& output_path,
                                 ResultEnvelope& result) const {
    try {
        if (output_path.has_parent_path()) {
            std::filesystem::create_directories(output_path.parent_path());
        }

        std::ofstream file(output_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Could not open output file: {}", output_path.string());
            return false;
        }

        file << result.stdout_output;
        if (!result.stderr_output.empty()) {
            file << "\n[stderr]\n" << result.stderr_output;
        }

        if (!file.good()) {
            spdlog::warn("Short write to output file: {}", output_path.string());
            return false;
        }

        result.log_path = output_path;
        return true;
    }
    catch (const std::filesystem::filesystem_error& e) {
        spdlog::warn("Failed to persist command output: {}", e.what());
        return false;
    }
}

} // namespace core
} // namespace redeyes
