/**
 * @file test_operations_log.cpp
 * @brief Tests for the audit trail and campaign summary
 */

#include "redeyes/core/operations_log.hpp"
#include "redeyes/core/target_registry.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

using namespace redeyes::core;
using redeyes::testing::ReadFile;
using redeyes::testing::TempDir;

namespace {

OperationRecord CommandRecord(const std::string& phase, const std::string& command, bool success) {
    OperationRecord record;
    record.phase = phase;
    record.command = command;
    record.success = success;
    record.exit_code = success ? 0 : 1;
    record.duration = std::chrono::milliseconds(10);
    return record;
}

OperationRecord AnalysisRecord(Phase phase, std::size_t analyzed) {
    OperationRecord record;
    record.phase = AnalysisTag(phase);
    record.ai_payload = "analysis";
    record.operations_analyzed = analyzed;
    return record;
}

} // anonymous namespace

TEST(OperationsLogTest, AppendKeepsOrder) {
    OperationsLog log;
    log.Append(CommandRecord("OSINT", "whois example.com", true));
    log.Append(CommandRecord("OSINT", "dig example.com", false));
    log.Append(AnalysisRecord(Phase::OSINT, 2));

    auto records = log.Snapshot();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(*records[0].command, "whois example.com");
    EXPECT_EQ(*records[1].command, "dig example.com");
    EXPECT_EQ(records[2].phase, "OSINT_ANALYSIS");

    auto recent = log.Recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(*recent[0].command, "dig example.com");
    EXPECT_EQ(log.Recent(10).size(), 3u);
}

TEST(OperationsLogTest, PhaseFilters) {
    OperationsLog log;
    log.Append(CommandRecord("OSINT", "whois example.com", true));
    log.Append(CommandRecord("ENUMERATION", "nmap 10.0.0.5", true));
    log.Append(AnalysisRecord(Phase::OSINT, 1));

    EXPECT_EQ(log.CountForPhase("OSINT"), 1u);
    EXPECT_EQ(log.CountForPhase("OSINT_ANALYSIS"), 1u);
    EXPECT_EQ(log.ForPhase("ENUMERATION").size(), 1u);
    EXPECT_TRUE(log.ForPhase("REPORTING").empty());
}

TEST(OperationsLogTest, SummaryCombinesLogAndRegistry) {
    TargetRegistry registry;
    registry.AddTarget("10.0.0.5");
    registry.AddTarget("10.0.0.6");
    registry.AddOpenPort("10.0.0.5", 22);
    registry.AddOpenPort("10.0.0.5", 80);
    registry.AddOpenPort("10.0.0.6", 443);
    registry.AddVulnerability("10.0.0.5", "CVE-2021-41773");
    registry.MarkExploited("10.0.0.5", "Shell via: hydra");

    OperationsLog log;
    OperationRecord plan;
    plan.phase = "PLANNING";
    plan.ai_payload = "plan";
    log.Append(plan);
    log.Append(CommandRecord("OSINT", "whois example.com", true));
    log.Append(CommandRecord("OSINT", "dig example.com", true));
    log.Append(CommandRecord("ENUMERATION", "nmap 10.0.0.5", false));
    log.Append(CommandRecord("ENUMERATION", "nmap 10.0.0.6", true));
    log.Append(AnalysisRecord(Phase::ENUMERATION, 2));

    auto summary = log.Summarize(registry);

    EXPECT_EQ(summary.total_operations, 6u);
    EXPECT_EQ(summary.successful_operations, 3u);
    EXPECT_DOUBLE_EQ(summary.success_rate, 0.75);
    EXPECT_EQ(summary.phases_completed,
              (std::vector<std::string>{"PLANNING", "OSINT", "ENUMERATION", "ENUMERATION_ANALYSIS"}));
    EXPECT_EQ(summary.targets_discovered, 2u);
    EXPECT_EQ(summary.targets_compromised, 1u);
    EXPECT_EQ(summary.total_vulnerabilities, 1u);
    EXPECT_EQ(summary.total_open_ports, 3u);
}

TEST(OperationsLogTest, EmptyLogHasZeroRate) {
    TargetRegistry registry;
    OperationsLog log;

    auto summary = log.Summarize(registry);
    EXPECT_EQ(summary.total_operations, 0u);
    EXPECT_DOUBLE_EQ(summary.success_rate, 0.0);
    EXPECT_TRUE(summary.phases_completed.empty());
}

TEST(OperationsLogTest, ExportOmitsAbsentFields) {
    TempDir dir;
    OperationsLog log;
    log.Append(CommandRecord("OSINT", "whois example.com", true));
    log.Append(AnalysisRecord(Phase::OSINT, 1));

    auto path = dir.Path() / "log" / "operations.json";
    ASSERT_TRUE(log.ExportJson(path));

    auto doc = nlohmann::json::parse(ReadFile(path));
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc[0]["command"], "whois example.com");
    EXPECT_EQ(doc[0]["duration_ms"], 10);
    EXPECT_FALSE(doc[0].contains("ai_payload"));
    EXPECT_EQ(doc[1]["phase"], "OSINT_ANALYSIS");
    EXPECT_EQ(doc[1]["operations_analyzed"], 1);
    EXPECT_FALSE(doc[1].contains("command"));
}
