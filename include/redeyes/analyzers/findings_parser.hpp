/**
 * @file findings_parser.hpp
 * @brief Extraction of hosts, ports, vulnerabilities and access indicators
 *        from captured tool output
 *
 * Recognizes the plain-text formats of the common scanners (nmap normal
 * output, masscan, hydra) plus bare address lines from DNS tooling. Output
 * in other formats simply yields no findings.
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace redeyes {
namespace analyzers {

/**
 * @struct DiscoveredHost
 * @brief Host seen in scanner output
 */
struct DiscoveredHost {
    std::string address;                    ///< IPv4 address
    std::optional<std::string> hostname;    ///< Name printed alongside, if any

    bool operator==(const DiscoveredHost& other) const {
        return address == other.address && hostname == other.hostname;
    }
};

/**
 * @struct PortFinding
 * @brief One open port line
 */
struct PortFinding {
    int port{0};
    std::string protocol;      ///< "tcp" or "udp"
    std::string descriptor;    ///< "<service> <product/version...>"
};

/**
 * @class FindingsParser
 * @brief Regex-driven parser for scanner output
 *
 * **Recognized Formats**:
 * - `Nmap scan report for host.example.com (10.0.0.5)` / `... for 10.0.0.5`
 * - `Discovered open port 443/tcp on 10.0.0.5` (masscan)
 * - `22/tcp   open  ssh     OpenSSH 8.2p1` (nmap port table)
 * - `CVE-2021-41617`, `VULNERABLE:`, `State: VULNERABLE` (NSE/vuln scanners)
 * - `[22][ssh] host: 10.0.0.5   login: root   password: toor` (hydra)
 *
 * **Thread Safety**: All methods are const and safe to call concurrently.
 */
class FindingsParser {
public:
    FindingsParser();

    /// Hosts in discovery order, deduplicated by address
    std::vector<DiscoveredHost> ParseHosts(const std::string& output) const;

    /// Open ports in output order, deduplicated by port/protocol
    std::vector<PortFinding> ParsePorts(const std::string& output) const;

    /**
     * @brief Vulnerability indicator lines
     *
     * Lines are trimmed, stripped of NSE `|`/`_` prefixes, truncated to
     * @p max_length and deduplicated.
     */
    std::vector<std::string> ParseVulnerabilities(const std::string& output,
                                                  std::size_t max_length = 200) const;

    /// Credentials as "<service> <login>:<password>"
    std::vector<std::string> ParseCredentials(const std::string& output) const;

    /**
     * @brief First success indicator present in the output (case-insensitive)
     * @return The matching indicator, or nullopt
     */
    static std::optional<std::string> FindSuccessIndicator(const std::string& output,
                                                           const std::vector<std::string>& indicators);

private:
    std::regex nmap_report_named_regex_;
    std::regex nmap_report_bare_regex_;
    std::regex masscan_regex_;
    std::regex port_line_regex_;
    std::regex hydra_regex_;
};

} // namespace analyzers
} // namespace redeyes
