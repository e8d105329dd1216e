/**
 * @file operations_log.hpp
 * @brief Append-only audit trail of campaign actions
 *
 * @date 2025
 */

#pragma once

#include "redeyes/core/models.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace redeyes {
namespace core {

class TargetRegistry;

/**
 * @struct CampaignSummary
 * @brief Aggregate statistics computed from the log and the registry
 */
struct CampaignSummary {
    std::size_t total_operations{0};
    std::size_t successful_operations{0};     ///< Among records that declare success
    double success_rate{0.0};                 ///< successful / records declaring success
    std::vector<std::string> phases_completed;  ///< Distinct tags, first-seen order
    std::size_t targets_discovered{0};
    std::size_t targets_compromised{0};
    std::size_t total_vulnerabilities{0};
    std::size_t total_open_ports{0};
};

/**
 * @class OperationsLog
 * @brief Ordered, mutex-guarded sequence of OperationRecord
 *
 * Records are never mutated or removed once appended. Summary figures are
 * recomputed on every call.
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class OperationsLog {
public:
    OperationsLog() = default;

    OperationsLog(const OperationsLog&) = delete;
    OperationsLog& operator=(const OperationsLog&) = delete;

    void Append(OperationRecord record);

    std::size_t Size() const;

    /// Copy of the full trail in append order
    std::vector<OperationRecord> Snapshot() const;

    /// Last @p count records, oldest first
    std::vector<OperationRecord> Recent(std::size_t count) const;

    /// Records whose phase tag equals @p tag
    std::vector<OperationRecord> ForPhase(const std::string& tag) const;

    /// Number of records whose phase tag equals @p tag
    std::size_t CountForPhase(const std::string& tag) const;

    /**
     * @brief Compute aggregate statistics
     * @param registry Source of target/exploit/vulnerability/port counts
     */
    CampaignSummary Summarize(const TargetRegistry& registry) const;

    /**
     * @brief Write the audit trail as a JSON array
     * @return true on success
     */
    bool ExportJson(const std::filesystem::path& path) const;

private:
    std::vector<OperationRecord> records_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace redeyes
