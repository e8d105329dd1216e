/**
 * @file operations_log.cpp
 * @brief Implementation of the audit trail and summary statistics
 *
 * @date 2025
 */

#include "redeyes/core/operations_log.hpp"
#include "redeyes/core/serialization.hpp"
#include "redeyes/core/target_registry.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace redeyes {
namespace core {

void OperationsLog::Append(OperationRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
}

std::size_t OperationsLog::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<OperationRecord> OperationsLog::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::vector<OperationRecord> OperationsLog::Recent(std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto start = records_.size() > count ? records_.end() - static_cast<std::ptrdiff_t>(count)
                                         : records_.begin();
    return std::vector<OperationRecord>(start, records_.end());
}

std::vector<OperationRecord> OperationsLog::ForPhase(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OperationRecord> matching;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(matching),
                 [&tag](const OperationRecord& r) { return r.phase == tag; });
    return matching;
}

std::size_t OperationsLog::CountForPhase(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [&tag](const OperationRecord& r) { return r.phase == tag; }));
}

CampaignSummary OperationsLog::Summarize(const TargetRegistry& registry) const {
    CampaignSummary summary;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        summary.total_operations = records_.size();

        std::size_t declaring = 0;
        for (const auto& record : records_) {
            if (record.success.has_value()) {
                ++declaring;
                if (*record.success) {
                    ++summary.successful_operations;
                }
            }
            auto& phases = summary.phases_completed;
            if (std::find(phases.begin(), phases.end(), record.phase) == phases.end()) {
                phases.push_back(record.phase);
            }
        }

        if (declaring > 0) {
            summary.success_rate = static_cast<double>(summary.successful_operations) /
                                   static_cast<double>(declaring);
        }
    }

    summary.targets_discovered = registry.Size();
    summary.targets_compromised = registry.CountExploited();
    summary.total_vulnerabilities = registry.CountVulnerabilities();
    summary.total_open_ports = registry.CountOpenPorts();

    return summary;
}

bool OperationsLog::ExportJson(const std::filesystem::path& path) const {
    json doc = json::array();
    for (const auto& record : Snapshot()) {
        doc.push_back(OperationToJson(record));
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to open operations log file: {}", path.string());
            return false;
        }
        file << doc.dump(2, ' ', false, json::error_handler_t::replace);
        return file.good();
    }
    catch (const std::exception& e) {
        spdlog::error("Operations log export failed: {}", e.what());
        return false;
    }
}

} // namespace core
} // namespace redeyes
