/**
 * @file json_reporter.cpp
 * @brief Implementation of the JSON campaign report
 *
 * The summary is taken from the context when REPORTING has produced one;
 * otherwise it is recomputed from the log and the registry so that a report
 * can be generated for a stopped or partially run campaign.
 *
 * @date 2025
 */

#include "redeyes/reporters/json_reporter.hpp"
#include "redeyes/core/serialization.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>

using json = nlohmann::json;

namespace redeyes {
namespace reporters {

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

bool JsonReporter::Publish(const core::CampaignContext& context) {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("GENERATING JSON REPORT");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    try {
        if (!std::filesystem::exists(config_.output_directory)) {
            std::filesystem::create_directories(config_.output_directory);
        }

        std::string content = GenerateJsonString(context);

        if (config_.validate_json && !ValidateSyntax(content)) {
            spdlog::error("Generated JSON is invalid");
            return false;
        }

        std::filesystem::path output_path = config_.output_directory / GenerateFilename(context);
        if (!SaveJson(content, output_path)) {
            spdlog::error("Failed to save JSON report");
            return false;
        }

        last_report_path_ = output_path;

        spdlog::info("✓ JSON Report generated successfully");
        spdlog::info("  Location: {}", output_path.string());
        spdlog::info("  Size: {} bytes", std::filesystem::file_size(output_path));
        spdlog::info("═══════════════════════════════════════════════════════════════\n");
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to generate JSON report: {}", e.what());
        return false;
    }
}

json JsonReporter::GenerateJson(const core::CampaignContext& context) const {
    json j;
    j["campaign_id"] = context.campaign_id;
    j["generated_at"] = core::FormatTimestamp(std::chrono::system_clock::now());
    j["target"] = context.target;
    j["scope"] = context.scope;

    core::CampaignSummary summary = context.final_summary.has_value()
        ? *context.final_summary
        : context.log.Summarize(context.registry);
    j["summary"] = SummaryToJson(summary);

    auto analysis = context.context_data.find("ai_final_analysis");
    j["final_analysis"] = analysis != context.context_data.end() ? analysis->second : "";

    json tools = json::array();
    for (const auto& name : context.AvailableTools()) {
        tools.push_back(name);
    }
    j["tools_available"] = tools;

    json targets = json::object();
    for (const auto& target : context.registry.Snapshot()) {
        targets[target.id] = core::TargetToJson(target);
    }
    j["targets"] = targets;

    if (config_.include_operations) {
        json operations = json::array();
        for (const auto& record : context.log.Snapshot()) {
            operations.push_back(core::OperationToJson(record));
        }
        j["operations"] = operations;
    }

    return j;
}

std::string JsonReporter::GenerateJsonString(const core::CampaignContext& context) const {
    return GenerateJson(context).dump(config_.pretty_print ? config_.indent_spaces : -1, ' ',
                                 false, json::error_handler_t::replace);
}

json JsonReporter::SummaryToJson(const core::CampaignSummary& summary) {
    return json{
        {"total_operations", summary.total_operations},
        {"successful_operations", summary.successful_operations},
        {"success_rate", summary.success_rate},
        {"phases_completed", summary.phases_completed},
        {"targets_discovered", summary.targets_discovered},
        {"targets_compromised", summary.targets_compromised},
        {"total_vulnerabilities", summary.total_vulnerabilities},
        {"total_open_ports", summary.total_open_ports}
    };
}

std::string JsonReporter::GenerateFilename(const core::CampaignContext& context) const {
    if (context.campaign_id.empty()) {
        return "campaign_unassigned.json";
    }
    return context.campaign_id + ".json";
}

bool JsonReporter::SaveJson(const std::string& content, const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", path.string());
        return false;
    }

    file << content;
    return static_cast<bool>(file);
}

bool JsonReporter::ValidateSyntax(const std::string& content) const {
    try {
        (void)json::parse(content);
        return true;
    }
    catch (const json::parse_error& e) {
        spdlog::error("JSON validation failed: {}", e.what());
        return false;
    }
}

} // namespace reporters
} // namespace redeyes
