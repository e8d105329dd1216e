/**
 * @file target_registry.cpp
 * @brief Implementation of the shared target map
 *
 * @date 2025
 */

#include "redeyes/core/target_registry.hpp"
#include "redeyes/core/serialization.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

using json = nlohmann::json;

namespace redeyes {
namespace core {

bool TargetRegistry::AddTarget(const std::string& id,
                               const std::optional<std::string>& hostname) {
    if (id.empty()) {
        throw RegistryError("Target id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = targets_.find(id);
    if (it != targets_.end()) {
        if (hostname && !hostname->empty() && !it->second.hostname) {
            it->second.hostname = hostname;
        }
        return false;
    }

    Target target;
    target.id = id;
    if (hostname && !hostname->empty()) {
        target.hostname = hostname;
    }
    targets_.emplace(id, std::move(target));

    spdlog::info("🎯 New target: {}{}", id, hostname ? " (" + *hostname + ")" : "");
    return true;
}

bool TargetRegistry::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.count(id) > 0;
}

bool TargetRegistry::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.empty();
}

std::size_t TargetRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return targets_.size();
}

std::optional<Target> TargetRegistry::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = targets_.find(id);
    if (it == targets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Target> TargetRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Target> snapshot;
    snapshot.reserve(targets_.size());
    for (const auto& [id, target] : targets_) {
        snapshot.push_back(target);
    }
    return snapshot;
}

std::vector<std::string> TargetRegistry::Ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(targets_.size());
    for (const auto& entry : targets_) {
        ids.push_back(entry.first);
    }
    return ids;
}

bool TargetRegistry::AddOpenPort(const std::string& id, int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetMutable(id).open_ports.insert(port).second;
}

bool TargetRegistry::AddService(const std::string& id, int port, const std::string& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetMutable(id).services.emplace(port, descriptor).second;
}

bool TargetRegistry::AddVulnerability(const std::string& id, const std::string& vulnerability) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& vulns = GetMutable(id).vulnerabilities;
    if (std::find(vulns.begin(), vulns.end(), vulnerability) != vulns.end()) {
        return false;
    }
    vulns.push_back(vulnerability);
    return true;
}

bool TargetRegistry::MarkExploited(const std::string& id, const std::string& shell_descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& target = GetMutable(id);

    bool newly_exploited = !target.exploited;
    target.exploited = true;
    if (!shell_descriptor.empty()) {
        target.shells.push_back(shell_descriptor);
    }

    if (newly_exploited) {
        spdlog::info("💥 Target compromised: {}", id);
    }
    return newly_exploited;
}

bool TargetRegistry::AddCredential(const std::string& id, const std::string& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& creds = GetMutable(id).credentials;
    if (std::find(creds.begin(), creds.end(), credential) != creds.end()) {
        return false;
    }
    creds.push_back(credential);
    return true;
}

void TargetRegistry::AddNote(const std::string& id, const std::string& note) {
    std::lock_guard<std::mutex> lock(mutex_);
    GetMutable(id).notes.push_back(note);
}

std::size_t TargetRegistry::CountExploited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(targets_.begin(), targets_.end(),
        [](const auto& entry) { return entry.second.exploited; }));
}

std::size_t TargetRegistry::CountVulnerabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& entry : targets_) {
        total += entry.second.vulnerabilities.size();
    }
    return total;
}

std::size_t TargetRegistry::CountOpenPorts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& entry : targets_) {
        total += entry.second.open_ports.size();
    }
    return total;
}

bool TargetRegistry::ExportJson(const std::filesystem::path& path) const {
    json doc = json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, target] : targets_) {
            doc[id] = TargetToJson(target);
        }
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to open registry export file: {}", path.string());
            return false;
        }
        file << doc.dump(2, ' ', false, json::error_handler_t::replace);
        spdlog::debug("Exported {} targets to {}", doc.size(), path.string());
        return file.good();
    }
    catch (const std::exception& e) {
        spdlog::error("Registry export failed: {}", e.what());
        return false;
    }
}

std::size_t TargetRegistry::ImportJson(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RegistryError("Cannot open target file: " + path.string());
    }

    std::vector<Target> loaded;
    try {
        json doc = json::parse(file);
        if (!doc.is_object()) {
            throw RegistryError("Target file must contain a JSON object: " + path.string());
        }
        for (const auto& [id, value] : doc.items()) {
            if (id.empty()) {
                continue;
            }
            loaded.push_back(TargetFromJson(id, value));
        }
    }
    catch (const json::exception& e) {
        throw RegistryError("Malformed target file " + path.string() + ": " + e.what());
    }
    catch (const std::logic_error& e) {
        throw RegistryError("Malformed service port in " + path.string() + ": " + e.what());
    }

    std::size_t imported = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& target : loaded) {
        if (targets_.count(target.id) > 0) {
            spdlog::debug("Skipping already known target: {}", target.id);
            continue;
        }
        std::string id = target.id;
        targets_.emplace(std::move(id), std::move(target));
        ++imported;
    }

    spdlog::info("Imported {} targets from {}", imported, path.string());
    return imported;
}

Target& TargetRegistry::GetMutable(const std::string& id) {
    auto it = targets_.find(id);
    if (it == targets_.end()) {
        throw RegistryError("Unknown target: " + id);
    }
    return it->second;
}

} // namespace core
} // namespace redeyes
