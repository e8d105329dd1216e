/**
 * @file campaign_config.hpp
 * @brief Campaign-wide configuration and its JSON form
 *
 * Allow-lists, deny-lists, success indicators and per-phase limits are data,
 * not code: everything here can be overridden from a JSON file.
 *
 * @date 2025
 */

#pragma once

#include "redeyes/analyzers/command_extractor.hpp"
#include "redeyes/core/oracle.hpp"
#include "redeyes/core/safe_executor.hpp"
#include "redeyes/integrations/resource_script_runner.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace redeyes {
namespace core {

/**
 * @struct ToolInfo
 * @brief Entry of the host's tool table
 *
 * Advisory only: feeds strategy prompts and the extractor's known tools but
 * is never enforced before execution.
 */
struct ToolInfo {
    bool available{false};
    std::string path;
};

/**
 * @struct PhaseLimits
 * @brief Fan-out and context bounds per phase
 */
struct PhaseLimits {
    std::size_t osint_commands{5};                       ///< Top candidates executed in OSINT
    std::size_t enumeration_targets{3};                  ///< First N registry targets
    std::size_t enumeration_commands_per_target{4};
    std::size_t vulnerability_commands_per_target{3};
    std::size_t exploitation_commands_per_target{2};
    std::size_t post_exploitation_commands_per_target{3};

    // Oracle context bounds
    std::size_t context_ports{10};
    std::size_t context_services{5};
    std::size_t context_vulnerabilities{5};
    std::size_t context_target_ids{10};
};

/**
 * @struct CampaignConfig
 * @brief Complete engine configuration
 */
struct CampaignConfig {
    std::filesystem::path results_directory{"results"};   ///< Command output root
    std::size_t worker_count{5};                          ///< Thread pool size

    ExecutorConfig executor;
    analyzers::ExtractorConfig extractor;
    analyzers::ExploitExtractorConfig exploit_extractor;
    integrations::ResourceScriptRunner::Config console;
    ProcessOracle::Config oracle;
    PhaseLimits limits;

    /// Case-insensitive output markers of a successful exploit
    std::vector<std::string> success_indicators{
        "session opened", "shell", "meterpreter", "command shell", "success"
    };

    std::map<std::string, ToolInfo> tools;     ///< Host tool table

    bool seed_primary_target{true};    ///< Register the campaign target if OSINT finds nothing
    bool verbose_logging{false};
};

/**
 * @brief Load a configuration file
 *
 * Keys absent from the file keep their defaults.
 *
 * @param path JSON file
 * @return Configuration, or nullopt if the file is unreadable or malformed
 */
std::optional<CampaignConfig> LoadCampaignConfig(const std::filesystem::path& path);

/**
 * @brief Check limits and timeouts
 *
 * Logs every problem found.
 *
 * @return true if the configuration is usable
 */
bool ValidateConfig(const CampaignConfig& config);

} // namespace core
} // namespace redeyes
