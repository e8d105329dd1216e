/**
 * @file resource_script_runner.hpp
 * @brief Non-interactive exploitation console driven by resource files
 *
 * Protocol: generate a resource file of console directives, invoke the
 * console with `-r <file> -q` through the Safe Executor, parse its output.
 *
 * @date 2025
 */

#pragma once

#include "redeyes/core/safe_executor.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace redeyes {
namespace integrations {

/**
 * @struct ConsoleOutcome
 * @brief What the console reported
 */
struct ConsoleOutcome {
    std::vector<std::string> sessions;    ///< "... session 1 opened ..." lines
    bool target_vulnerable{false};        ///< `check` reported the target vulnerable
    std::vector<std::string> errors;      ///< "[-] ..." lines
};

/**
 * @struct ConsoleResult
 * @brief Executor envelope plus parsed console outcome
 */
struct ConsoleResult {
    core::ResultEnvelope envelope;
    ConsoleOutcome outcome;
    std::filesystem::path script_path;
};

/**
 * @class ResourceScriptRunner
 * @brief Runs framework-syntax commands through a resource file
 *
 * For a module selection (`use <module>`) the script also sets RHOSTS to
 * the target, sets LHOST, runs `check` and launches `exploit -j`. Every
 * script ends with `exit` so the console never waits for input.
 *
 * **Usage Example**:
 * @code
 * ResourceScriptRunner runner(executor, ResourceScriptRunner::Config{});
 * if (ResourceScriptRunner::IsFrameworkCommand(cmd)) {
 *     auto result = runner.Run(cmd, "10.0.0.5", results_dir / "exploitation");
 * }
 * @endcode
 */
class ResourceScriptRunner {
public:
    /**
     * @struct Config
     * @brief Console invocation settings
     */
    struct Config {
        std::string console_binary{"msfconsole"};
        std::chrono::seconds timeout{600};             ///< Exploits get 10 minutes
        std::size_t max_output_bytes{2048 * 1024};
        std::string lhost{"0.0.0.0"};                  ///< Callback address
    };

    ResourceScriptRunner(const core::SafeExecutor& executor, const Config& config);

    /// `use ...` commands and anything mentioning metasploit
    static bool IsFrameworkCommand(const std::string& command);

    /// Resource file contents for a command against a target
    std::string GenerateScript(const std::string& command, const std::string& target) const;

    /**
     * @brief Write the script and run the console on it
     *
     * The command itself is checked against the executor's deny-list before
     * any file is written.
     *
     * @param command Framework command (typically `use <module>`)
     * @param target Target id for RHOSTS
     * @param scripts_directory Where the resource file is written
     * @param output_path Optional console transcript location
     */
    ConsoleResult Run(const std::string& command,
                      const std::string& target,
                      const std::filesystem::path& scripts_directory,
                      const std::optional<std::filesystem::path>& output_path = std::nullopt) const;

    /// Extract sessions, check verdict and errors from console output
    static ConsoleOutcome ParseOutput(const std::string& output);

    const Config& GetConfig() const { return config_; }

private:
    const core::SafeExecutor& executor_;
    Config config_;
};

} // namespace integrations
} // namespace redeyes
