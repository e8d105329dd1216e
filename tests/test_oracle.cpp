/**
 * @file test_oracle.cpp
 * @brief Tests for the process-backed strategy oracle
 */

#include "redeyes/core/oracle.hpp"

#include <gtest/gtest.h>

using namespace redeyes::core;

TEST(ProcessOracleTest, UnconfiguredOracleDegradesToMessage) {
    ProcessOracle oracle(ProcessOracle::Config{});

    EXPECT_FALSE(oracle.IsConfigured());
    EXPECT_EQ(oracle.Query("plan", "system"), "AI not available - configure an oracle command");
    EXPECT_TRUE(oracle.History().empty());
}

TEST(ProcessOracleTest, PromptIsPassedOnStdin) {
    ProcessOracle::Config config;
    config.command = {"cat"};
    ProcessOracle oracle(config);

    auto response = oracle.Query("Which ports?", "You are a tester.", "Known targets: 1");
    EXPECT_EQ(response, "System: You are a tester.\n\nContext: Known targets: 1\n\nUser: Which ports?");

    auto history = oracle.History();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].sender, "user");
    EXPECT_EQ(history[0].content, "Which ports?");
    EXPECT_EQ(history[1].sender, "ai");
}

TEST(ProcessOracleTest, ComposeOmitsEmptySystemPrompt) {
    EXPECT_EQ(ProcessOracle::ComposePrompt("hi", "", "ctx"), "Context: ctx\n\nUser: hi");
}

TEST(ProcessOracleTest, MissingBinaryReturnsErrorString) {
    ProcessOracle::Config config;
    config.command = {"/nonexistent/redeyes-model"};
    ProcessOracle oracle(config);

    auto response = oracle.Query("plan", "system");
    EXPECT_EQ(response.rfind("AI Error: ", 0), 0u);
}

TEST(ProcessOracleTest, TimeoutReturnsErrorString) {
    ProcessOracle::Config config;
    config.command = {"sleep", "5"};
    config.timeout = std::chrono::seconds(1);
    ProcessOracle oracle(config);

    auto response = oracle.Query("plan", "system");
    EXPECT_EQ(response.rfind("AI Error: ", 0), 0u);
    EXPECT_NE(response.find("timed out"), std::string::npos);
}

TEST(ProcessOracleTest, HistoryIsBounded) {
    ProcessOracle::Config config;
    config.command = {"cat"};
    config.history_limit = 4;
    ProcessOracle oracle(config);

    for (int i = 0; i < 5; ++i) {
        oracle.Query("q" + std::to_string(i), "");
    }

    auto history = oracle.History();
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0].content, "q3");
}
