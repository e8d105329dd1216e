/**
 * @file test_campaign_config.cpp
 * @brief Tests for configuration loading and validation
 */

#include "redeyes/core/campaign_config.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace redeyes::core;
using redeyes::testing::TempDir;
using redeyes::testing::WriteFile;

TEST(CampaignConfigTest, DefaultsMatchCampaignConstants) {
    CampaignConfig config;

    EXPECT_EQ(config.executor.default_timeout.count(), 300);
    EXPECT_EQ(config.console.timeout.count(), 600);
    EXPECT_EQ(config.oracle.timeout.count(), 120);
    EXPECT_EQ(config.extractor.max_commands, 10u);
    EXPECT_EQ(config.exploit_extractor.max_commands, 5u);
    EXPECT_EQ(config.limits.osint_commands, 5u);
    EXPECT_EQ(config.limits.enumeration_targets, 3u);
    EXPECT_EQ(config.limits.enumeration_commands_per_target, 4u);
    EXPECT_EQ(config.limits.vulnerability_commands_per_target, 3u);
    EXPECT_EQ(config.limits.exploitation_commands_per_target, 2u);
    EXPECT_EQ(config.limits.post_exploitation_commands_per_target, 3u);
    EXPECT_TRUE(ValidateConfig(config));
}

TEST(CampaignConfigTest, LoadOverridesOnlyPresentKeys) {
    TempDir dir;
    auto path = dir.Path() / "campaign.json";
    WriteFile(path, R"({
        "results_directory": "/tmp/redeyes-results",
        "worker_count": 2,
        "executor": { "timeout_seconds": 30, "max_output_kb": 64 },
        "extractor": { "allow_list": ["nmap", "masscan"] },
        "oracle": { "command": ["ollama", "run", "llama3"], "timeout_seconds": 45 },
        "limits": { "osint_commands": 2 },
        "success_indicators": ["pwned"],
        "tools": { "nmap": { "available": true, "path": "/usr/bin/nmap" } }
    })");

    auto config = LoadCampaignConfig(path);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->results_directory, std::filesystem::path("/tmp/redeyes-results"));
    EXPECT_EQ(config->worker_count, 2u);
    EXPECT_EQ(config->executor.default_timeout.count(), 30);
    EXPECT_EQ(config->executor.default_max_output_bytes, 64u * 1024u);
    EXPECT_FALSE(config->executor.blocked_patterns.empty());
    EXPECT_EQ(config->extractor.allow_list, (std::set<std::string>{"nmap", "masscan"}));
    EXPECT_EQ(config->extractor.max_commands, 10u);
    EXPECT_EQ(config->oracle.command, (std::vector<std::string>{"ollama", "run", "llama3"}));
    EXPECT_EQ(config->oracle.timeout.count(), 45);
    EXPECT_EQ(config->limits.osint_commands, 2u);
    EXPECT_EQ(config->limits.enumeration_targets, 3u);
    EXPECT_EQ(config->success_indicators, (std::vector<std::string>{"pwned"}));
    ASSERT_EQ(config->tools.count("nmap"), 1u);
    EXPECT_TRUE(config->tools.at("nmap").available);
    EXPECT_EQ(config->tools.at("nmap").path, "/usr/bin/nmap");
}

TEST(CampaignConfigTest, MalformedOrMissingFileIsNullopt) {
    TempDir dir;
    auto path = dir.Path() / "broken.json";
    WriteFile(path, R"({ "worker_count": "many" })");

    EXPECT_FALSE(LoadCampaignConfig(path).has_value());
    EXPECT_FALSE(LoadCampaignConfig(dir.Path() / "absent.json").has_value());
}

TEST(CampaignConfigTest, ValidationRejectsZeroLimits) {
    CampaignConfig config;
    config.worker_count = 0;
    EXPECT_FALSE(ValidateConfig(config));

    config = CampaignConfig{};
    config.executor.default_timeout = std::chrono::seconds(0);
    EXPECT_FALSE(ValidateConfig(config));

    config = CampaignConfig{};
    config.extractor.max_commands = 0;
    EXPECT_FALSE(ValidateConfig(config));
}
