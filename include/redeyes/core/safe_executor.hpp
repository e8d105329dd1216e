/**
 * @file safe_executor.hpp
 * @brief Safety-gated execution of oracle-derived commands
 *
 * Runs one process at a time per call with a hard wall-clock timeout, output
 * truncation, optional persistence of the output, and a deny-list of
 * catastrophic patterns checked before anything is spawned.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace redeyes {
namespace core {

/// Reserved exit code: rejected by the catastrophic-pattern deny-list
constexpr int kExitBlocked = 126;
/// Reserved exit code: killed at the wall-clock deadline
constexpr int kExitTimeout = 124;
/// Reserved exit code: binary missing, permission denied or other spawn error
constexpr int kExitSpawnFailure = 127;

/// Appended to stdout when it exceeds the byte limit
extern const char* const kTruncationMarker;

/**
 * @struct ResultEnvelope
 * @brief Outcome of one Safe Executor call
 */
struct ResultEnvelope {
    bool success{false};                         ///< Exit code 0 and not blocked/timed out
    std::string stdout_output;                   ///< Captured (possibly truncated) stdout
    std::string stderr_output;                   ///< Captured stderr
    int exit_code{0};                            ///< Process exit code or reserved code
    std::chrono::milliseconds duration{0};       ///< Wall-clock runtime
    bool truncated{false};                       ///< stdout exceeded the byte limit
    std::optional<std::filesystem::path> log_path;  ///< Where output was persisted
    std::optional<std::string> error;            ///< Blocked/timeout/spawn description
};

/**
 * @struct ExecutorConfig
 * @brief Defaults and deny-list for the Safe Executor
 */
struct ExecutorConfig {
    std::chrono::seconds default_timeout{300};      ///< Per-command limit (5 min)
    std::size_t default_max_output_bytes{2048 * 1024};  ///< 2 MiB stdout cap

    /// Case-insensitive substrings that reject a command before spawning
    std::vector<std::string> blocked_patterns{
        "rm -rf /",
        "mkfs",
        ":(){:|:&};:",
        ":(){ :|:& };:",
        "dd if=/dev/zero",
        "dd if=/dev/random",
        "> /dev/sd",
        "shred /"
    };

    bool verbose_logging{false};
};

/**
 * @class SafeExecutor
 * @brief The only component that runs oracle-derived commands
 *
 * **Contract**:
 * - Catastrophic commands are rejected with exit code kExitBlocked, zero
 *   duration and no process spawned; no output file is written.
 * - Timeouts return kExitTimeout with a duration of at least the timeout.
 * - stdout longer than the limit is cut to the limit and kTruncationMarker is
 *   appended.
 * - Never throws: spawn and persistence failures come back as a failed
 *   envelope with `error` set.
 *
 * **Thread Safety**: Execute() is safe to call concurrently; the executor
 * holds only immutable configuration.
 *
 * **Usage Example**:
 * @code
 * SafeExecutor executor;
 * auto result = executor.Execute("nmap -sV 10.0.0.1", results_dir,
 *                                std::chrono::seconds(300), 2 * 1024 * 1024,
 *                                results_dir / "enumeration" / "scan.txt");
 * if (!result.success) {
 *     spdlog::warn("exit {}: {}", result.exit_code, result.error.value_or(""));
 * }
 * @endcode
 */
class SafeExecutor {
public:
    explicit SafeExecutor(const ExecutorConfig& config);
    explicit SafeExecutor();

    /**
     * @brief Run a command string through /bin/sh
     *
     * @param command Shell command line
     * @param working_directory Child working directory (empty = inherit)
     * @param timeout Hard wall-clock limit
     * @param max_output_bytes stdout cap before the truncation marker
     * @param output_path Optional file to persist stdout (+ stderr section)
     */
    ResultEnvelope Execute(const std::string& command,
                           const std::filesystem::path& working_directory,
                           std::chrono::seconds timeout,
                           std::size_t max_output_bytes,
                           const std::optional<std::filesystem::path>& output_path = std::nullopt) const;

    /**
     * @brief Run a structured argument vector without a shell
     *
     * The deny-list is checked against the space-joined argv.
     */
    ResultEnvelope Execute(const std::vector<std::string>& argv,
                           const std::filesystem::path& working_directory,
                           std::chrono::seconds timeout,
                           std::size_t max_output_bytes,
                           const std::optional<std::filesystem::path>& output_path = std::nullopt) const;

    /// Run with the configured default timeout and output cap
    ResultEnvelope Execute(const std::string& command,
                           const std::filesystem::path& working_directory) const;

    /**
     * @brief Check a command against the deny-list
     * @return The matched pattern, or nullopt when the command is allowed
     */
    std::optional<std::string> FindBlockedPattern(const std::string& command) const;

    const ExecutorConfig& GetConfig() const { return config_; }

private:
    ExecutorConfig config_;

    ResultEnvelope Run(const std::vector<std::string>& argv,
                       const std::string& description,
                       const std::filesystem::path& working_directory,
                       std::chrono::seconds timeout,
                       std::size_t max_output_bytes,
                       const std::optional<std::filesystem::path>& output_path) const;

    bool PersistOutput(const std::filesystem::path& output_path,
                       ResultEnvelope& result) const;
};

} // namespace core
} // namespace redeyes
