/**
 * @file test_findings_parser.cpp
 * @brief Tests for recognizing hosts, ports, vulnerabilities and credentials
 */

#include "redeyes/analyzers/findings_parser.hpp"

#include <gtest/gtest.h>

using namespace redeyes::analyzers;

class FindingsParserTest : public ::testing::Test {
protected:
    FindingsParser parser;
};

TEST_F(FindingsParserTest, ParsesServiceLine) {
    auto ports = parser.ParsePorts("22/tcp open ssh OpenSSH 8.2\n");

    ASSERT_EQ(ports.size(), 1u);
    EXPECT_EQ(ports[0].port, 22);
    EXPECT_EQ(ports[0].protocol, "tcp");
    EXPECT_EQ(ports[0].descriptor, "ssh OpenSSH 8.2");
}

TEST_F(FindingsParserTest, IgnoresClosedAndFilteredPorts) {
    std::string output =
        "PORT     STATE    SERVICE VERSION\n"
        "22/tcp   open     ssh     OpenSSH 8.2p1 Ubuntu\n"
        "25/tcp   closed   smtp\n"
        "80/tcp   open     http    Apache httpd 2.4.41\n"
        "445/tcp  filtered microsoft-ds\n"
        "161/udp  open     snmp\n";

    auto ports = parser.ParsePorts(output);
    ASSERT_EQ(ports.size(), 3u);
    EXPECT_EQ(ports[0].port, 22);
    EXPECT_EQ(ports[1].port, 80);
    EXPECT_EQ(ports[1].descriptor, "http Apache httpd 2.4.41");
    EXPECT_EQ(ports[2].port, 161);
    EXPECT_EQ(ports[2].protocol, "udp");
    EXPECT_EQ(ports[2].descriptor, "snmp");
}

TEST_F(FindingsParserTest, ParsesNmapAndMasscanHosts) {
    std::string output =
        "Nmap scan report for www.example.com (93.184.216.34)\n"
        "Nmap scan report for 10.0.0.7\n"
        "Discovered open port 443/tcp on 10.0.0.8\n"
        "10.0.0.9\n"
        "Nmap scan report for 10.0.0.7\n";

    auto hosts = parser.ParseHosts(output);
    ASSERT_EQ(hosts.size(), 4u);
    EXPECT_EQ(hosts[0].address, "93.184.216.34");
    ASSERT_TRUE(hosts[0].hostname.has_value());
    EXPECT_EQ(*hosts[0].hostname, "www.example.com");
    EXPECT_EQ(hosts[1], (DiscoveredHost{"10.0.0.7", std::nullopt}));
    EXPECT_EQ(hosts[2].address, "10.0.0.8");
    EXPECT_EQ(hosts[3].address, "10.0.0.9");
}

TEST_F(FindingsParserTest, RejectsInvalidAddresses) {
    EXPECT_TRUE(parser.ParseHosts("999.1.1.1\nno hosts here\n").empty());
}

TEST_F(FindingsParserTest, ExtractsVulnerabilityLines) {
    std::string output =
        "| smb-vuln-ms17-010:\n"
        "|   VULNERABLE:\n"
        "|     IDs:  CVE:CVE-2017-0143\n"
        "|_  CVE-2017-0143 listed twice\n"
        "|_  CVE-2017-0143 listed twice\n"
        "Host is up.\n";

    auto vulns = parser.ParseVulnerabilities(output);
    ASSERT_EQ(vulns.size(), 3u);
    EXPECT_EQ(vulns[0], "VULNERABLE:");
    EXPECT_EQ(vulns[1], "IDs:  CVE:CVE-2017-0143");
    EXPECT_EQ(vulns[2], "CVE-2017-0143 listed twice");
}

TEST_F(FindingsParserTest, LongVulnerabilityLinesAreTruncated) {
    std::string line = "CVE-2021-41773 " + std::string(400, 'x');
    auto vulns = parser.ParseVulnerabilities(line, 200);

    ASSERT_EQ(vulns.size(), 1u);
    EXPECT_EQ(vulns[0].size(), 200u);
}

TEST_F(FindingsParserTest, ParsesHydraCredentials) {
    std::string output =
        "[DATA] attacking ssh://10.0.0.5:22/\n"
        "[22][ssh] host: 10.0.0.5   login: root   password: toor\n"
        "1 of 1 target successfully completed, 1 valid password found\n";

    auto creds = parser.ParseCredentials(output);
    ASSERT_EQ(creds.size(), 1u);
    EXPECT_EQ(creds[0], "ssh root:toor");
}

TEST_F(FindingsParserTest, SuccessIndicatorMatchesIgnoringCase) {
    std::vector<std::string> indicators{"session opened", "meterpreter"};

    auto hit = FindingsParser::FindSuccessIndicator("[*] Meterpreter Session 1 opened", indicators);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "meterpreter");

    EXPECT_FALSE(FindingsParser::FindSuccessIndicator("[-] Exploit failed", indicators).has_value());
}
