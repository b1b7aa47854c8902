#include <gtest/gtest.h>
#include "shell_command.hpp"

class ShellCommandTest : public ::testing::Test {};

// Test that safe words are left bare
TEST_F(ShellCommandTest, QuoteLeavesSafeWordsBare) {
    EXPECT_EQ(ShellCommand::quote("public_html/site-1.tar.gz"), "public_html/site-1.tar.gz");
    EXPECT_EQ(ShellCommand::quote("--ftp-user=admin@example.com"), "--ftp-user=admin@example.com");
}

// Test quoting of spaces, quotes and empty words
TEST_F(ShellCommandTest, QuoteWrapsUnsafeWords) {
    EXPECT_EQ(ShellCommand::quote("my site"), "'my site'");
    EXPECT_EQ(ShellCommand::quote("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(ShellCommand::quote("$(rm -rf /)"), "'$(rm -rf /)'");
    EXPECT_EQ(ShellCommand::quote(""), "''");
}

TEST_F(ShellCommandTest, RendersPipesAndRawTokens) {
    ShellCommand command("du");
    command.arg("-sb").arg("/home/u/my site").raw("2>/dev/null").pipe(ShellCommand("cut").arg("-f1"));
    EXPECT_EQ(command.str(), "du -sb '/home/u/my site' 2>/dev/null | cut -f1");
}

TEST_F(ShellCommandTest, RendersAndChains) {
    ShellCommand command("cd");
    command.arg("/srv").then(ShellCommand("tar").args({"czf", "a.tar.gz", "--", "www"}));
    EXPECT_EQ(command.str(), "cd /srv && tar czf a.tar.gz -- www");
}

// Test that secrets only show up in the executed text
TEST_F(ShellCommandTest, SecretsAreMaskedInRedactedText) {
    ShellCommand command("wget");
    command.arg("--ftp-user=u").secretArg("--ftp-password=p w").arg("-O").arg("x");
    EXPECT_EQ(command.str(), "wget --ftp-user=u '--ftp-password=p w' -O x");
    EXPECT_EQ(command.redacted(), "wget --ftp-user=u **** -O x");
}

TEST_F(ShellCommandTest, SanitizeArchiveName) {
    EXPECT_EQ(sanitizeArchiveName("site name$_20250101.tar.gz"), "site_name__20250101.tar.gz");
    EXPECT_EQ(sanitizeArchiveName("info_20250101_120000.tar.gz"), "info_20250101_120000.tar.gz");
}

TEST_F(ShellCommandTest, JoinRemotePath) {
    EXPECT_EQ(joinRemotePath("/home/u/", "/tmp_trans"), "/home/u/tmp_trans");
    EXPECT_EQ(joinRemotePath("/", "site"), "/site");
    EXPECT_EQ(joinRemotePath("", "site"), "site");
    EXPECT_EQ(joinRemotePath("/home/u", ""), "/home/u");
}

TEST_F(ShellCommandTest, SplitRemotePath) {
    EXPECT_EQ(splitRemotePath("mail/example.com/info/"), std::make_pair(std::string("mail/example.com"), std::string("info")));
    EXPECT_EQ(splitRemotePath("site"), std::make_pair(std::string(), std::string("site")));
    EXPECT_EQ(splitRemotePath("/site"), std::make_pair(std::string("/"), std::string("site")));
}

TEST_F(ShellCommandTest, ResolveRemotePath) {
    EXPECT_EQ(resolveRemotePath("/home/u", "public_html"), "/home/u/public_html");
    EXPECT_EQ(resolveRemotePath("/home/u", "/var/www/"), "/var/www");
}
