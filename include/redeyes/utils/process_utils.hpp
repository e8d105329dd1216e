/**
 * @file process_utils.hpp
 * @brief POSIX child-process execution with deadlines and bounded capture
 *
 * The single place where the project crosses the OS process boundary. Spawns
 * a child in its own process group, optionally feeds it stdin, captures
 * stdout/stderr up to a byte limit, and kills the whole group when the
 * wall-clock deadline passes.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace redeyes {
namespace utils {

/**
 * @struct ProcessSpec
 * @brief Description of one child process invocation
 */
struct ProcessSpec {
    std::vector<std::string> argv;                    ///< argv[0] resolved via PATH
    std::filesystem::path working_directory;          ///< Empty = inherit
    std::optional<std::string> stdin_data;            ///< Written then closed; nullopt = /dev/null
    std::chrono::milliseconds timeout{300000};        ///< Hard wall-clock limit
    std::size_t max_output_bytes{2 * 1024 * 1024};    ///< Per-stream capture limit
};

/**
 * @struct ProcessResult
 * @brief Raw outcome of a child process
 */
struct ProcessResult {
    int exit_code{-1};                     ///< Exit status, 128+signal when killed
    std::string stdout_output;             ///< Captured stdout (at most max_output_bytes)
    std::string stderr_output;             ///< Captured stderr (at most max_output_bytes)
    bool stdout_truncated{false};          ///< stdout exceeded the limit
    bool stderr_truncated{false};          ///< stderr exceeded the limit
    bool timed_out{false};                 ///< Deadline reached, group killed
    bool spawn_failed{false};              ///< pipe/fork/chdir/exec failed
    std::string error_message;             ///< Set when spawn_failed
    std::chrono::milliseconds duration{0}; ///< Wall-clock time from fork to reap
};

/**
 * @class ProcessUtils
 * @brief Child process helpers
 *
 * **Thread Safety**: RunProcess() may be called concurrently from multiple
 * threads; each call owns its pipes and child.
 */
class ProcessUtils {
public:
    /**
     * @brief Run a process to completion or until its deadline
     *
     * Never throws for process-level failures: spawn errors are reported via
     * `spawn_failed` and `error_message`.
     *
     * @param spec Invocation description
     * @return Captured outcome
     */
    static ProcessResult RunProcess(const ProcessSpec& spec);

    /// Wrap a command string as `/bin/sh -c <command>`
    static std::vector<std::string> ShellArgv(const std::string& command);

    /// Render an argv for display and pattern checks (space-joined)
    static std::string DescribeArgv(const std::vector<std::string>& argv);
};

} // namespace utils
} // namespace redeyes
