/**
 * @file findings_parser.cpp
 * @brief Implementation of scanner output parsing
 *
 * @date 2025
 */

#include "redeyes/analyzers/findings_parser.hpp"
#include "redeyes/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <stdexcept>

namespace redeyes {
namespace analyzers {

using utils::StringUtils;

namespace {

// std::regex backtracks recursively; longer lines are never scanner records
constexpr std::size_t kMaxScanLineLength = 4096;

} // anonymous namespace

FindingsParser::FindingsParser() {
    nmap_report_named_regex_ = std::regex(
        R"(Nmap scan report for (\S+) \((\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})\))");
    nmap_report_bare_regex_ = std::regex(
        R"(Nmap scan report for (\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})\s*$)");
    masscan_regex_ = std::regex(
        R"(Discovered open port \d+/(?:tcp|udp) on (\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))");
    port_line_regex_ = std::regex(
        R"(^(\d+)/(tcp|udp)\s+open\s+(\S+)\s*(.*)$)");
    hydra_regex_ = std::regex(
        R"(\[\d+\]\[(\S+)\]\s+host:\s+\S+\s+login:\s+(\S+)\s+password:\s+(\S+))");
}

std::vector<DiscoveredHost> FindingsParser::ParseHosts(const std::string& output) const {
    std::vector<DiscoveredHost> hosts;
    std::set<std::string> seen;

    auto add = [&](const std::string& address, std::optional<std::string> hostname) {
        if (!StringUtils::IsIPAddress(address)) {
            return;
        }
        if (seen.insert(address).second) {
            hosts.push_back(DiscoveredHost{address, std::move(hostname)});
        }
    };

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw);
        if (line.empty() || line.size() > kMaxScanLineLength) {
            continue;
        }

        std::smatch match;
        if (std::regex_search(line, match, nmap_report_named_regex_)) {
            add(match[2].str(), match[1].str());
        } else if (std::regex_search(line, match, nmap_report_bare_regex_)) {
            add(match[1].str(), std::nullopt);
        } else if (std::regex_search(line, match, masscan_regex_)) {
            add(match[1].str(), std::nullopt);
        } else if (StringUtils::IsIPAddress(line)) {
            // dig +short, host lists
            add(line, std::nullopt);
        }
    }

    if (!hosts.empty()) {
        spdlog::debug("Parsed {} hosts from output", hosts.size());
    }
    return hosts;
}

std::vector<PortFinding> FindingsParser::ParsePorts(const std::string& output) const {
    std::vector<PortFinding> ports;
    std::set<std::string> seen;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw);
        if (line.size() > kMaxScanLineLength) {
            continue;
        }

        std::smatch match;
        if (!std::regex_match(line, match, port_line_regex_)) {
            continue;
        }

        int port = 0;
        try {
            port = std::stoi(match[1].str());
        }
        catch (const std::out_of_range&) {
            continue;
        }
        if (port <= 0 || port > 65535) {
            continue;
        }

        std::string key = match[1].str() + "/" + match[2].str();
        if (!seen.insert(key).second) {
            continue;
        }

        PortFinding finding;
        finding.port = port;
        finding.protocol = match[2].str();
        finding.descriptor = match[3].str();
        std::string rest = StringUtils::Trim(match[4].str());
        if (!rest.empty()) {
            finding.descriptor += " " + rest;
        }
        ports.push_back(std::move(finding));
    }

    return ports;
}

std::vector<std::string> FindingsParser::ParseVulnerabilities(const std::string& output,
                                                              std::size_t max_length) const {
    std::vector<std::string> vulns;
    std::set<std::string> seen;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        if (!StringUtils::Contains(raw, "CVE-") && !StringUtils::Contains(raw, "VULNERABLE")) {
            continue;
        }

        // NSE script output is prefixed with "|" or "|_"
        std::string line = StringUtils::Trim(raw);
        auto first = line.find_first_not_of("|_ \t");
        if (first == std::string::npos) {
            continue;
        }
        line = StringUtils::Truncate(line.substr(first), max_length);

        if (seen.insert(line).second) {
            vulns.push_back(line);
        }
    }

    return vulns;
}

std::vector<std::string> FindingsParser::ParseCredentials(const std::string& output) const {
    std::vector<std::string> credentials;
    std::set<std::string> seen;

    for (const auto& line : StringUtils::SplitLines(output)) {
        if (line.size() > kMaxScanLineLength || !StringUtils::Contains(line, "login:")) {
            continue;
        }

        std::smatch match;
        if (!std::regex_search(line, match, hydra_regex_)) {
            continue;
        }

        std::string credential = match[1].str() + " " + match[2].str() + ":" + match[3].str();
        if (seen.insert(credential).second) {
            credentials.push_back(credential);
        }
    }

    return credentials;
}

std::optional<std::string> FindingsParser::FindSuccessIndicator(const std::string& output,
                                                                const std::vector<std::string>& indicators) {
    auto match = StringUtils::FindAnyIgnoreCase(output, indicators);
    if (match.empty()) {
        return std::nullopt;
    }
    return match;
}

} // namespace analyzers
} // namespace redeyes
