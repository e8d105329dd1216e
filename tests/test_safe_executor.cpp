/**
 * @file test_safe_executor.cpp
 * @brief Tests for command execution, limits and persistence
 */

#include "redeyes/core/safe_executor.hpp"
#include "redeyes/utils/string_utils.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <thread>

using namespace redeyes::core;
using redeyes::testing::ReadFile;
using redeyes::testing::TempDir;

namespace {

/// false once the process is gone or only a zombie
bool ProcessAlive(const std::string& pid) {
    std::ifstream stat("/proc/" + pid + "/stat");
    if (!stat.is_open()) {
        return false;
    }
    std::string line;
    std::getline(stat, line);
    auto close_paren = line.rfind(')');
    return close_paren != std::string::npos && close_paren + 2 < line.size() &&
           line[close_paren + 2] != 'Z';
}

} // anonymous namespace

class SafeExecutorTest : public ::testing::Test {
protected:
    TempDir dir;
    SafeExecutor executor;
};

TEST_F(SafeExecutorTest, SuccessfulCommandCapturesAndPersistsOutput) {
    auto out = dir.Path() / "osint" / "echo.txt";
    auto result = executor.Execute("echo hello", dir.Path(), std::chrono::seconds(10), 4096, out);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hello\n");
    EXPECT_FALSE(result.truncated);
    ASSERT_TRUE(result.log_path.has_value());
    EXPECT_EQ(*result.log_path, out);
    EXPECT_EQ(ReadFile(out), "hello\n");
}

TEST_F(SafeExecutorTest, NonZeroExitIsReportedNotThrown) {
    auto result = executor.Execute("echo oops >&2; exit 3", dir.Path());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stderr_output, "oops\n");
}

TEST_F(SafeExecutorTest, BlockedPatternNeverSpawnsOrWrites) {
    auto out = dir.Path() / "blocked.txt";
    auto result = executor.Execute("rm -rf / --no-preserve-root", dir.Path(),
                                   std::chrono::seconds(10), 4096, out);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, kExitBlocked);
    EXPECT_EQ(result.duration.count(), 0);
    EXPECT_TRUE(result.error.has_value());
    EXPECT_FALSE(result.log_path.has_value());
    EXPECT_FALSE(std::filesystem::exists(out));
}

TEST_F(SafeExecutorTest, ForkBombIsBlocked) {
    auto result = executor.Execute(":(){ :|:& };:", dir.Path());
    EXPECT_EQ(result.exit_code, kExitBlocked);
}

TEST_F(SafeExecutorTest, FindBlockedPatternReportsMatch) {
    auto pattern = executor.FindBlockedPattern("sudo mkfs.ext4 /dev/sda1");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(*pattern, "mkfs");
    EXPECT_FALSE(executor.FindBlockedPattern("nmap -sV 10.0.0.5").has_value());
}

TEST_F(SafeExecutorTest, TimeoutKillsCommand) {
    auto result = executor.Execute("sleep 5", dir.Path(), std::chrono::seconds(1), 4096);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, kExitTimeout);
    EXPECT_TRUE(result.error.has_value());
    EXPECT_GE(result.duration.count(), 1000);
    EXPECT_LT(result.duration.count(), 4000);
}

TEST_F(SafeExecutorTest, OutputIsTruncatedAtLimit) {
    auto result = executor.Execute("head -c 5000 /dev/zero | tr '\\0' a", dir.Path(),
                                   std::chrono::seconds(10), 1000);

    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_output.substr(0, 1000), std::string(1000, 'a'));
    EXPECT_EQ(result.stdout_output.substr(1000), std::string(kTruncationMarker));
}

TEST_F(SafeExecutorTest, MissingBinaryIsSpawnFailure) {
    std::vector<std::string> argv{"/nonexistent/redeyes-missing-tool", "--version"};
    auto result = executor.Execute(argv, dir.Path(), std::chrono::seconds(5), 4096);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, kExitSpawnFailure);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("redeyes-missing-tool"), std::string::npos);
}

TEST_F(SafeExecutorTest, ArgvFormRunsWithoutShell) {
    std::vector<std::string> argv{"echo", "a;b", "$HOME"};
    auto result = executor.Execute(argv, dir.Path(), std::chrono::seconds(5), 4096);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_output, "a;b $HOME\n");
}

TEST_F(SafeExecutorTest, ConfiguredDenyListReplacesDefaults) {
    ExecutorConfig config;
    config.blocked_patterns = {"forbidden-tool"};
    SafeExecutor custom(config);

    EXPECT_EQ(custom.Execute("forbidden-tool --go", dir.Path()).exit_code, kExitBlocked);
    EXPECT_FALSE(custom.FindBlockedPattern("mkfs.ext4 /dev/null").has_value());
}

TEST_F(SafeExecutorTest, MissingBinaryInShellCommandCarriesError) {
    auto result = executor.Execute("redeyes-no-such-tool --help", dir.Path());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, kExitSpawnFailure);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("not found"), std::string::npos);
}

TEST_F(SafeExecutorTest, BackgroundChildrenDieWithTheCommand) {
    auto result = executor.Execute("sleep 30 >/dev/null 2>&1 & echo $!", dir.Path(),
                                   std::chrono::seconds(10), 4096);

    ASSERT_TRUE(result.success);
    std::string pid = redeyes::utils::StringUtils::Trim(result.stdout_output);
    ASSERT_FALSE(pid.empty());

    bool alive = true;
    for (int i = 0; i < 200 && alive; ++i) {
        alive = ProcessAlive(pid);
        if (alive) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    EXPECT_FALSE(alive);
    EXPECT_LT(result.duration.count(), 5000);
}
