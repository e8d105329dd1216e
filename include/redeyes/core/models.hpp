/**
 * @file models.hpp
 * @brief Campaign data model: phases, targets, audit records and error types
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace redeyes {
namespace core {

/**
 * @enum Phase
 * @brief Sequential phases of a campaign
 *
 * Strictly linear and one-directional. Each phase is visited at most once per
 * campaign; REPORTING is terminal.
 */
enum class Phase {
    PLANNING,            ///< Overall strategy query, no execution
    OSINT,               ///< Open-source reconnaissance, host discovery
    ENUMERATION,         ///< Port and service discovery per target
    VULNERABILITY,       ///< Vulnerability assessment of targets with open ports
    EXPLOITATION,        ///< Exploit attempts against vulnerable targets
    POST_EXPLOITATION,   ///< Follow-up work on exploited targets
    REPORTING            ///< Final aggregate summary and handoff
};

/// All phases in campaign order
const std::vector<Phase>& AllPhases();

/// Upper-case identifier ("OSINT", "POST_EXPLOITATION", ...)
std::string PhaseToString(Phase phase);

/// Inverse of PhaseToString(); nullopt for unknown names
std::optional<Phase> PhaseFromString(const std::string& name);

/// Meta-record tag for a phase's closing analysis ("OSINT_ANALYSIS")
std::string AnalysisTag(Phase phase);

/**
 * @struct Target
 * @brief Addressable host under test with accumulated findings
 *
 * Ports are a set; vulnerabilities keep insertion order with duplicates
 * suppressed. `exploited` is latched: once true it is never reset within a
 * campaign.
 */
struct Target {
    std::string id;                              ///< Network address (unique key)
    std::optional<std::string> hostname;         ///< Resolved or discovered name
    std::set<int> open_ports;                    ///< Unique open ports
    std::map<int, std::string> services;         ///< Port → service descriptor
    std::vector<std::string> vulnerabilities;    ///< Ordered, deduplicated
    bool exploited{false};                       ///< Latched access flag
    std::vector<std::string> shells;             ///< Shell/session descriptors
    std::vector<std::string> credentials;        ///< Recovered credentials
    std::vector<std::string> notes;              ///< Free-text notes
};

/**
 * @struct OperationRecord
 * @brief One immutable audit entry
 *
 * Command attempts carry command/target/duration/success; planning and
 * analysis entries carry `ai_payload` instead.
 */
struct OperationRecord {
    std::string phase;                                     ///< Phase id or "<PHASE>_ANALYSIS"
    std::optional<std::string> command;
    std::optional<std::string> target;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<std::chrono::milliseconds> duration;
    std::optional<bool> success;
    std::optional<int> exit_code;
    std::optional<std::size_t> output_length;
    std::optional<std::string> error;
    std::optional<std::string> ai_payload;                 ///< Plan or analysis text
    std::optional<std::size_t> operations_analyzed;        ///< Analysis entries only
    std::optional<bool> exploited;                         ///< Exploitation entries only
};

/**
 * @class BookkeepingError
 * @brief Failure in the campaign's own state tracking
 *
 * The only error class allowed to escape a campaign. Per-command and
 * per-query failures are recovered locally; this one is fatal.
 */
class BookkeepingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Target Registry misuse or unreadable persistent form
class RegistryError : public BookkeepingError {
public:
    using BookkeepingError::BookkeepingError;
};

/// Illegal phase transition
class CampaignStateError : public BookkeepingError {
public:
    using BookkeepingError::BookkeepingError;
};

} // namespace core
} // namespace redeyes
