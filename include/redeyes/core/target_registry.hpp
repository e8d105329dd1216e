/**
 * @file target_registry.hpp
 * @brief Shared, concurrently updated map of campaign targets
 *
 * Every mutation is an insert, append or dedup on a single field of one
 * target. Concurrent tool completions that report overlapping findings for
 * the same target therefore merge instead of overwriting each other.
 *
 * @date 2025
 */

#pragma once

#include "redeyes/core/models.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace redeyes {
namespace core {

/**
 * @class TargetRegistry
 * @brief Mutex-guarded target map owned by the host
 *
 * Readers receive value snapshots. Mutating a target that was never added
 * throws RegistryError, which is a fatal bookkeeping failure for a campaign.
 *
 * **Thread Safety**: All methods are thread-safe.
 *
 * **Usage Example**:
 * @code
 * TargetRegistry registry;
 * registry.AddTarget("10.0.0.5");
 * registry.AddOpenPort("10.0.0.5", 22);
 * registry.AddService("10.0.0.5", 22, "ssh OpenSSH 8.2");
 * registry.AddVulnerability("10.0.0.5", "CVE-2021-41617");
 * @endcode
 */
class TargetRegistry {
public:
    TargetRegistry() = default;

    TargetRegistry(const TargetRegistry&) = delete;
    TargetRegistry& operator=(const TargetRegistry&) = delete;

    /**
     * @brief Insert a target if it is not already known
     * @param id Network address
     * @param hostname Optional name; fills an empty hostname on existing targets
     * @return true if the target was newly created
     * @throws RegistryError on an empty id
     */
    bool AddTarget(const std::string& id,
                   const std::optional<std::string>& hostname = std::nullopt);

    bool Contains(const std::string& id) const;
    bool Empty() const;
    std::size_t Size() const;

    /// Snapshot of one target
    std::optional<Target> Get(const std::string& id) const;

    /// Snapshot of all targets in id order
    std::vector<Target> Snapshot() const;

    /// Target ids in id order
    std::vector<std::string> Ids() const;

    // Field-level mutations; all throw RegistryError for unknown ids

    /// @return true if the port was not yet recorded
    bool AddOpenPort(const std::string& id, int port);

    /// Record a service descriptor for a port unless one is already known
    /// @return true if the descriptor was stored
    bool AddService(const std::string& id, int port, const std::string& descriptor);

    /// @return true if the vulnerability was not yet recorded
    bool AddVulnerability(const std::string& id, const std::string& vulnerability);

    /**
     * @brief Latch the exploited flag and append a shell descriptor
     * @return true if this call flipped the flag from false to true
     */
    bool MarkExploited(const std::string& id, const std::string& shell_descriptor);

    /// @return true if the credential was not yet recorded
    bool AddCredential(const std::string& id, const std::string& credential);

    void AddNote(const std::string& id, const std::string& note);

    // Aggregates, computed on demand

    std::size_t CountExploited() const;
    std::size_t CountVulnerabilities() const;
    std::size_t CountOpenPorts() const;

    /**
     * @brief Write all targets to a JSON file
     * @return true on success
     */
    bool ExportJson(const std::filesystem::path& path) const;

    /**
     * @brief Import targets from a JSON file
     *
     * Ids already present are skipped.
     *
     * @return Number of targets imported
     * @throws RegistryError if the file cannot be read or parsed
     */
    std::size_t ImportJson(const std::filesystem::path& path);

private:
    Target& GetMutable(const std::string& id);

    std::map<std::string, Target> targets_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace redeyes
