/**
 * @file serialization.cpp
 * @brief JSON mapping for targets and operation records
 *
 * @date 2025
 */

#include "redeyes/core/serialization.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace redeyes {
namespace core {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

json TargetToJson(const Target& target) {
    json services = json::object();
    for (const auto& [port, descriptor] : target.services) {
        services[std::to_string(port)] = descriptor;
    }

    json j;
    j["hostname"] = target.hostname ? json(*target.hostname) : json(nullptr);
    j["open_ports"] = std::vector<int>(target.open_ports.begin(), target.open_ports.end());
    j["services"] = services;
    j["vulnerabilities"] = target.vulnerabilities;
    j["exploited"] = target.exploited;
    j["shells"] = target.shells;
    j["credentials"] = target.credentials;
    j["notes"] = target.notes;
    return j;
}

namespace {

void AppendUnique(std::vector<std::string>& dst, const std::string& value) {
    if (std::find(dst.begin(), dst.end(), value) == dst.end()) {
        dst.push_back(value);
    }
}

} // anonymous namespace

Target TargetFromJson(const std::string& id, const json& j) {
    Target target;
    target.id = id;

    if (j.contains("hostname") && j["hostname"].is_string()) {
        target.hostname = j["hostname"].get<std::string>();
    }
    if (j.contains("open_ports")) {
        for (const auto& port : j["open_ports"]) {
            target.open_ports.insert(port.get<int>());
        }
    }
    if (j.contains("services")) {
        for (const auto& [port, descriptor] : j["services"].items()) {
            target.services.emplace(std::stoi(port), descriptor.get<std::string>());
        }
    }
    if (j.contains("vulnerabilities")) {
        for (const auto& vuln : j["vulnerabilities"]) {
            AppendUnique(target.vulnerabilities, vuln.get<std::string>());
        }
    }
    target.exploited = j.value("exploited", false);
    if (j.contains("shells")) {
        target.shells = j["shells"].get<std::vector<std::string>>();
    }
    if (j.contains("credentials")) {
        for (const auto& credential : j["credentials"]) {
            AppendUnique(target.credentials, credential.get<std::string>());
        }
    }
    if (j.contains("notes")) {
        target.notes = j["notes"].get<std::vector<std::string>>();
    }

    return target;
}

json OperationToJson(const OperationRecord& record) {
    json j;
    j["phase"] = record.phase;
    j["timestamp"] = FormatTimestamp(record.timestamp);

    if (record.command) j["command"] = *record.command;
    if (record.target) j["target"] = *record.target;
    if (record.duration) j["duration_ms"] = record.duration->count();
    if (record.success) j["success"] = *record.success;
    if (record.exit_code) j["exit_code"] = *record.exit_code;
    if (record.output_length) j["output_length"] = *record.output_length;
    if (record.error) j["error"] = *record.error;
    if (record.ai_payload) j["ai_payload"] = *record.ai_payload;
    if (record.operations_analyzed) j["operations_analyzed"] = *record.operations_analyzed;
    if (record.exploited) j["exploited"] = *record.exploited;

    return j;
}

} // namespace core
} // namespace redeyes
