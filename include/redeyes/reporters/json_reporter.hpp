/**
 * @file json_reporter.hpp
 * @brief Machine-readable campaign report
 *
 * Consumes the REPORTING handoff and writes one JSON document holding the
 * campaign summary, the final oracle analysis, every target and the full
 * operations log.
 *
 * @date 2025
 */

#pragma once

#include "redeyes/core/campaign_context.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace redeyes {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief JSON report configuration
 */
struct JsonReporterConfig {
    std::filesystem::path output_directory{"results"};  ///< Report destination
    bool pretty_print{true};
    int indent_spaces{2};
    bool include_operations{true};                      ///< Embed the full operations log
    bool validate_json{true};                           ///< Re-parse before writing
};

/**
 * @class JsonReporter
 * @brief Writes `<campaign_id>.json` into the output directory
 *
 * **Report Layout**:
 * ```json
 * {
 *   "campaign_id": "campaign_20250301_120000_1234",
 *   "generated_at": "2025-03-01T12:30:00.000Z",
 *   "target": "example.com",
 *   "scope": ["external perimeter"],
 *   "summary": { "total_operations": 42, "success_rate": 0.8, ... },
 *   "final_analysis": "...",
 *   "targets": { "10.0.0.5": { "open_ports": [22, 80], ... } },
 *   "operations": [ { "phase": "OSINT", "command": "dig example.com", ... } ]
 * }
 * ```
 *
 * **Usage Example**:
 * @code
 * JsonReporterConfig config;
 * config.output_directory = "results";
 *
 * auto reporter = std::make_shared<JsonReporter>(config);
 * engine.AttachReportSink(reporter);
 * @endcode
 */
class JsonReporter : public core::ReportSink {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Write the report file
     * @return true if the file was written
     */
    bool Publish(const core::CampaignContext& context) override;

    /// Report document without writing it
    nlohmann::json GenerateJson(const core::CampaignContext& context) const;

    std::string GenerateJsonString(const core::CampaignContext& context) const;

    /// Path of the most recent successful Publish, empty before that
    const std::filesystem::path& GetLastReportPath() const { return last_report_path_; }

    static nlohmann::json SummaryToJson(const core::CampaignSummary& summary);

private:
    JsonReporterConfig config_;
    std::filesystem::path last_report_path_;

    std::string GenerateFilename(const core::CampaignContext& context) const;
    bool SaveJson(const std::string& content, const std::filesystem::path& path) const;
    bool ValidateSyntax(const std::string& content) const;
};

} // namespace reporters
} // namespace redeyes
