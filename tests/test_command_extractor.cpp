/**
 * @file test_command_extractor.cpp
 * @brief Tests for turning oracle text into candidate commands
 */

#include "redeyes/analyzers/command_extractor.hpp"

#include <gtest/gtest.h>

using namespace redeyes::analyzers;

TEST(CommandExtractorTest, FencedBlockSkipsComments) {
    CommandExtractor extractor;
    std::string text =
        "Start with a port scan:\n"
        "```bash\n"
        "# full TCP sweep\n"
        "nmap -sV 10.0.0.5\n"
        "```\n";

    auto commands = extractor.Extract(text, {});
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], "nmap -sV 10.0.0.5");
}

TEST(CommandExtractorTest, FencedLinesAreTakenWithoutAllowList) {
    CommandExtractor extractor;
    std::string text = "```\nsubfinder -d example.com\n```\n";

    auto commands = extractor.Extract(text, {});
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], "subfinder -d example.com");
}

TEST(CommandExtractorTest, MegabyteFencedBlockIsScannedLineByLine) {
    CommandExtractor extractor;
    std::string text = "Plan:\n```bash\n";
    for (int i = 0; text.size() < (1u << 20); ++i) {
        text += "echo line " + std::to_string(i) + "\n";
    }
    text += "```\n";

    auto commands = extractor.Extract(text, {});
    ASSERT_EQ(commands.size(), 10u);
    EXPECT_EQ(commands[0], "echo line 0");
    EXPECT_EQ(commands[9], "echo line 9");
}

TEST(CommandExtractorTest, BacktickInsideBlockDoesNotLeakProse) {
    CommandExtractor extractor;
    std::string text =
        "```bash\n"
        "echo `id`\n"
        "```\n"
        "Then review the results carefully\n"
        "```bash\n"
        "nmap -sV 10.0.0.1\n"
        "```\n";

    auto commands = extractor.Extract(text, {});
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0], "echo `id`");
    EXPECT_EQ(commands[1], "nmap -sV 10.0.0.1");
}

TEST(CommandExtractorTest, UnterminatedBlockContributesNothing) {
    CommandExtractor extractor;
    auto commands = extractor.Extract("```bash\ncustom-recon --deep\n", {});
    EXPECT_TRUE(commands.empty());
}

TEST(CommandExtractorTest, ProseLinesNeedAllowListedOrKnownTool) {
    CommandExtractor extractor;
    std::string text =
        "First resolve the domain.\n"
        "dig example.com ANY\n"
        "theHarvester -d example.com -b all\n"
        "amass enum -d example.com\n";

    auto without_tools = extractor.Extract(text, {});
    ASSERT_EQ(without_tools.size(), 1u);
    EXPECT_EQ(without_tools[0], "dig example.com ANY");

    auto with_tools = extractor.Extract(text, {"amass"});
    ASSERT_EQ(with_tools.size(), 2u);
    EXPECT_EQ(with_tools[1], "amass enum -d example.com");
}

TEST(CommandExtractorTest, FencedCommandsComeFirstAndDuplicatesCollapse) {
    CommandExtractor extractor;
    std::string text =
        "whois example.com\n"
        "```sh\n"
        "whois example.com\n"
        "host example.com\n"
        "```\n";

    auto commands = extractor.Extract(text, {});
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0], "whois example.com");
    EXPECT_EQ(commands[1], "host example.com");
}

TEST(CommandExtractorTest, ResultIsCapped) {
    CommandExtractor extractor;
    std::string text = "```\n";
    for (int i = 0; i < 20; ++i) {
        text += "ping -c 1 10.0.0." + std::to_string(i) + "\n";
    }
    text += "```\n";

    auto commands = extractor.Extract(text, {});
    ASSERT_EQ(commands.size(), 10u);
    EXPECT_EQ(commands.front(), "ping -c 1 10.0.0.0");
    EXPECT_EQ(commands.back(), "ping -c 1 10.0.0.9");
}

TEST(CommandExtractorTest, NoActionableCommandsIsEmpty) {
    CommandExtractor extractor;
    EXPECT_TRUE(extractor.Extract("AI not available - configure an oracle command", {}).empty());
    EXPECT_TRUE(extractor.Extract("", {}).empty());
}

TEST(CommandExtractorTest, CommentDetection) {
    EXPECT_TRUE(CommandExtractor::IsCommentLine("# note"));
    EXPECT_TRUE(CommandExtractor::IsCommentLine("// note"));
    EXPECT_FALSE(CommandExtractor::IsCommentLine("nmap 10.0.0.1"));
}

TEST(ExploitCommandExtractorTest, RecognizesFrameworkAndCredentialCommands) {
    ExploitCommandExtractor extractor;
    std::string text =
        "Try the Samba module:\n"
        "use exploit/multi/samba/usermap_script\n"
        "set RHOSTS 10.0.0.5\n"
        "Then brute force SSH:\n"
        "hydra -l root -P rockyou.txt ssh://10.0.0.5\n"
        "nmap -sV 10.0.0.5\n";

    auto commands = extractor.Extract(text);
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0], "use exploit/multi/samba/usermap_script");
    EXPECT_EQ(commands[1], "set RHOSTS 10.0.0.5");
    EXPECT_EQ(commands[2], "hydra -l root -P rockyou.txt ssh://10.0.0.5");
}

TEST(ExploitCommandExtractorTest, SqlmapRequiresDump) {
    ExploitCommandExtractor extractor;
    auto commands = extractor.Extract(
        "sqlmap -u http://10.0.0.5/item?id=1 --batch\n"
        "sqlmap -u http://10.0.0.5/item?id=1 --dump\n");

    ASSERT_EQ(commands.size(), 1u);
    EXPECT_NE(commands[0].find("--dump"), std::string::npos);
}

TEST(ExploitCommandExtractorTest, ResultIsCappedAtFive) {
    ExploitCommandExtractor extractor;
    std::string text;
    for (int i = 0; i < 8; ++i) {
        text += "ssh user" + std::to_string(i) + "@10.0.0.5\n";
    }
    EXPECT_EQ(extractor.Extract(text).size(), 5u);
}

TEST(ExploitCommandExtractorTest, DestructiveFilterIsCaseInsensitive) {
    ExploitCommandExtractor extractor;
    EXPECT_TRUE(extractor.IsDestructive("ssh root@10.0.0.5 'RM -RF /var/www'"));
    EXPECT_TRUE(extractor.IsDestructive("sqlmap -u http://x --dump --sql-query='DELETE FROM users'"));
    EXPECT_FALSE(extractor.IsDestructive("hydra -l admin -P pass.txt ftp://10.0.0.5"));
}

TEST(ExploitCommandExtractorTest, OversizedLinesAreIgnored) {
    ExploitCommandExtractor extractor;
    std::string text = "```\nuse " + std::string(1u << 20, 'a') + "\n```\n"
                       "hydra -l root -P rockyou.txt ssh://10.0.0.5\n";

    auto commands = extractor.Extract(text);
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0], "hydra -l root -P rockyou.txt ssh://10.0.0.5");
}
