/**
 * @file test_json_reporter.cpp
 * @brief Tests for the JSON campaign report
 */

#include "redeyes/reporters/json_reporter.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace redeyes::core;
using redeyes::reporters::JsonReporter;
using redeyes::reporters::JsonReporterConfig;
using redeyes::testing::ReadFile;
using redeyes::testing::TempDir;

TEST(JsonReporterTest, PublishWritesCampaignDocument) {
    TempDir dir;
    TargetRegistry registry;
    OperationsLog log;

    registry.AddTarget("10.0.0.5");
    registry.AddOpenPort("10.0.0.5", 22);

    OperationRecord record;
    record.phase = "ENUMERATION";
    record.command = "nmap -sV 10.0.0.5";
    record.target = "10.0.0.5";
    record.success = true;
    log.Append(record);

    CampaignContext context("example.com", {"external perimeter"}, registry, log, dir.Path());
    context.campaign_id = "campaign_20250301_120000_1234";
    context.context_data["ai_final_analysis"] = "Patch OpenSSH.";
    context.tools["nmap"] = ToolInfo{true, "/usr/bin/nmap"};

    JsonReporterConfig config;
    config.output_directory = dir.Path() / "reports";
    JsonReporter reporter(config);

    ASSERT_TRUE(reporter.Publish(context));
    EXPECT_EQ(reporter.GetLastReportPath(),
              dir.Path() / "reports" / "campaign_20250301_120000_1234.json");

    auto doc = nlohmann::json::parse(ReadFile(reporter.GetLastReportPath()));
    EXPECT_EQ(doc["campaign_id"], "campaign_20250301_120000_1234");
    EXPECT_EQ(doc["target"], "example.com");
    EXPECT_EQ(doc["scope"][0], "external perimeter");
    EXPECT_EQ(doc["final_analysis"], "Patch OpenSSH.");
    EXPECT_EQ(doc["tools_available"][0], "nmap");
    EXPECT_EQ(doc["summary"]["total_operations"], 1);
    EXPECT_EQ(doc["summary"]["total_open_ports"], 1);
    EXPECT_EQ(doc["targets"]["10.0.0.5"]["open_ports"][0], 22);
    ASSERT_EQ(doc["operations"].size(), 1u);
    EXPECT_EQ(doc["operations"][0]["command"], "nmap -sV 10.0.0.5");
}

TEST(JsonReporterTest, FinalSummaryTakesPrecedence) {
    TempDir dir;
    TargetRegistry registry;
    OperationsLog log;
    CampaignContext context("example.com", {}, registry, log, dir.Path());

    CampaignSummary summary;
    summary.total_operations = 42;
    context.final_summary = summary;

    JsonReporterConfig config;
    config.include_operations = false;
    JsonReporter reporter(config);

    auto doc = reporter.GenerateJson(context);
    EXPECT_EQ(doc["summary"]["total_operations"], 42);
    EXPECT_FALSE(doc.contains("operations"));
    EXPECT_EQ(doc["final_analysis"], "");
}
