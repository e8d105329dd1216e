/**
 * @file campaign_config.cpp
 * @brief JSON loading and validation of CampaignConfig
 *
 * **File Layout** (every key optional):
 * ```json
 * {
 *   "results_directory": "results",
 *   "worker_count": 5,
 *   "executor": { "timeout_seconds": 300, "max_output_kb": 2048, "blocked_patterns": [] },
 *   "extractor": { "allow_list": [], "max_commands": 10 },
 *   "exploit_extractor": { "max_commands": 5, "destructive_patterns": [] },
 *   "console": { "binary": "msfconsole", "timeout_seconds": 600, "lhost": "0.0.0.0" },
 *   "oracle": { "command": ["ollama", "run", "llama3"], "timeout_seconds": 120 },
 *   "limits": { "osint_commands": 5, ... },
 *   "success_indicators": [],
 *   "tools": { "nmap": { "available": true, "path": "/usr/bin/nmap" } },
 *   "seed_primary_target": true,
 *   "verbose": false
 * }
 * ```
 *
 * @date 2025
 */

#include "redeyes/core/campaign_config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace redeyes {
namespace core {

namespace {

void LoadSeconds(const json& j, const char* key, std::chrono::seconds& out) {
    if (j.contains(key)) {
        out = std::chrono::seconds(j.at(key).get<long long>());
    }
}

template <typename T>
void LoadValue(const json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

void LoadLimits(const json& j, PhaseLimits& limits) {
    LoadValue(j, "osint_commands", limits.osint_commands);
    LoadValue(j, "enumeration_targets", limits.enumeration_targets);
    LoadValue(j, "enumeration_commands_per_target", limits.enumeration_commands_per_target);
    LoadValue(j, "vulnerability_commands_per_target", limits.vulnerability_commands_per_target);
    LoadValue(j, "exploitation_commands_per_target", limits.exploitation_commands_per_target);
    LoadValue(j, "post_exploitation_commands_per_target", limits.post_exploitation_commands_per_target);
    LoadValue(j, "context_ports", limits.context_ports);
    LoadValue(j, "context_services", limits.context_services);
    LoadValue(j, "context_vulnerabilities", limits.context_vulnerabilities);
    LoadValue(j, "context_target_ids", limits.context_target_ids);
}

} // anonymous namespace

std::optional<CampaignConfig> LoadCampaignConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Cannot open config file: {}", path.string());
        return std::nullopt;
    }

    CampaignConfig config;

    try {
        json j = json::parse(file);

        if (j.contains("results_directory")) {
            config.results_directory = j["results_directory"].get<std::string>();
        }
        LoadValue(j, "worker_count", config.worker_count);
        LoadValue(j, "success_indicators", config.success_indicators);
        LoadValue(j, "seed_primary_target", config.seed_primary_target);
        LoadValue(j, "verbose", config.verbose_logging);

        if (j.contains("executor")) {
            const auto& e = j["executor"];
            LoadSeconds(e, "timeout_seconds", config.executor.default_timeout);
            if (e.contains("max_output_kb")) {
                config.executor.default_max_output_bytes = e["max_output_kb"].get<std::size_t>() * 1024;
            }
            LoadValue(e, "blocked_patterns", config.executor.blocked_patterns);
        }

        if (j.contains("extractor")) {
            const auto& e = j["extractor"];
            LoadValue(e, "allow_list", config.extractor.allow_list);
            LoadValue(e, "max_commands", config.extractor.max_commands);
        }

        if (j.contains("exploit_extractor")) {
            const auto& e = j["exploit_extractor"];
            LoadValue(e, "max_commands", config.exploit_extractor.max_commands);
            LoadValue(e, "destructive_patterns", config.exploit_extractor.destructive_patterns);
        }

        if (j.contains("console")) {
            const auto& c = j["console"];
            LoadValue(c, "binary", config.console.console_binary);
            LoadSeconds(c, "timeout_seconds", config.console.timeout);
            LoadValue(c, "lhost", config.console.lhost);
        }

        if (j.contains("oracle")) {
            const auto& o = j["oracle"];
            LoadValue(o, "command", config.oracle.command);
            LoadSeconds(o, "timeout_seconds", config.oracle.timeout);
            LoadValue(o, "history_limit", config.oracle.history_limit);
        }

        if (j.contains("limits")) {
            LoadLimits(j["limits"], config.limits);
        }

        if (j.contains("tools")) {
            for (const auto& [name, entry] : j["tools"].items()) {
                ToolInfo info;
                info.available = entry.value("available", false);
                info.path = entry.value("path", std::string());
                config.tools[name] = info;
            }
        }
    }
    catch (const json::exception& e) {
        spdlog::error("Failed to parse config {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    config.executor.verbose_logging = config.verbose_logging;
    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

bool ValidateConfig(const CampaignConfig& config) {
    bool valid = true;

    auto fail = [&valid](const std::string& message) {
        spdlog::error("Invalid configuration: {}", message);
        valid = false;
    };

    if (config.worker_count == 0) {
        fail("worker_count must be positive");
    }
    if (config.executor.default_timeout.count() <= 0) {
        fail("executor timeout must be positive");
    }
    if (config.executor.default_max_output_bytes == 0) {
        fail("executor output cap must be positive");
    }
    if (config.console.timeout.count() <= 0) {
        fail("console timeout must be positive");
    }
    if (config.oracle.timeout.count() <= 0) {
        fail("oracle timeout must be positive");
    }
    if (config.extractor.max_commands == 0) {
        fail("extractor max_commands must be positive");
    }
    if (config.exploit_extractor.max_commands == 0) {
        fail("exploit extractor max_commands must be positive");
    }
    if (config.results_directory.empty()) {
        fail("results_directory must not be empty");
    }

    return valid;
}

} // namespace core
} // namespace redeyes
