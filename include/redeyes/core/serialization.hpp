/**
 * @file serialization.hpp
 * @brief JSON mapping for targets and operation records
 *
 * Shared by the registry's persistent form, the operations log export and the
 * campaign report so that all three agree on one schema.
 *
 * @date 2025
 */

#pragma once

#include "redeyes/core/models.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace redeyes {
namespace core {

/// ISO 8601 UTC with milliseconds ("2025-03-01T12:00:00.123Z")
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief Serialize a target (without its id, which is the enclosing key)
 *
 * Services are keyed by the port number as a string.
 */
nlohmann::json TargetToJson(const Target& target);

/**
 * @brief Deserialize a target
 *
 * Missing fields keep their defaults; vulnerabilities and credentials are
 * deduplicated on load.
 *
 * @throws nlohmann::json::exception on type mismatches
 */
Target TargetFromJson(const std::string& id, const nlohmann::json& j);

/// Serialize an audit record; absent optionals are omitted
nlohmann::json OperationToJson(const OperationRecord& record);

} // namespace core
} // namespace redeyes
