/**
 * @file campaign_context.hpp
 * @brief State passed into every phase, and the reporting handoff contract
 *
 * @date 2025
 */

#pragma once

#include "redeyes/core/campaign_config.hpp"
#include "redeyes/core/operations_log.hpp"
#include "redeyes/core/target_registry.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace redeyes {
namespace core {

/**
 * @struct CampaignContext
 * @brief Explicit campaign state shared by all phase functions
 *
 * The registry and the log are owned by the host and only referenced here;
 * both are internally synchronized.
 */
struct CampaignContext {
    CampaignContext(std::string target_id,
                    std::vector<std::string> scope_entries,
                    TargetRegistry& target_registry,
                    OperationsLog& operations_log,
                    std::filesystem::path results_dir)
        : target(std::move(target_id))
        , scope(std::move(scope_entries))
        , registry(target_registry)
        , log(operations_log)
        , results_directory(std::move(results_dir)) {
    }

    std::string campaign_id;                          ///< Set by CampaignEngine::Run
    std::string target;                               ///< Primary campaign target
    std::vector<std::string> scope;                   ///< Authorized scope statements
    TargetRegistry& registry;
    OperationsLog& log;
    std::filesystem::path results_directory;          ///< Command output root
    std::map<std::string, ToolInfo> tools;            ///< Advisory tool table
    std::map<std::string, std::string> context_data;  ///< Free-form outputs (final analysis, ...)
    std::optional<CampaignSummary> final_summary;     ///< Written by REPORTING

    /// Names of tools marked available
    std::set<std::string> AvailableTools() const {
        std::set<std::string> names;
        for (const auto& [name, info] : tools) {
            if (info.available) {
                names.insert(name);
            }
        }
        return names;
    }
};

/**
 * @class ReportSink
 * @brief Consumer of the REPORTING handoff
 */
class ReportSink {
public:
    virtual ~ReportSink() = default;

    /**
     * @brief Publish the finished campaign
     * @return true on success
     */
    virtual bool Publish(const CampaignContext& context) = 0;
};

} // namespace core
} // namespace redeyes
