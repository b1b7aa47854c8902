#include <gtest/gtest.h>
#include "fake_remote_session.hpp"
#include "verifier.hpp"

class VerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_.on("-type d 2>/dev/null", "4\n");
        target_.on("-type d 2>/dev/null", "4\n");
    }

    TransferLogger logger_{"", LogLevel::Error, false};
    DirectoryProber prober_{logger_, std::chrono::seconds(30)};
    Verifier verifier_{prober_, logger_};
    FakeRemoteSession source_{"src.example.com"};
    FakeRemoteSession target_{"dst.example.com"};
};

// Test equal counts
TEST_F(VerifierTest, MatchingCounts) {
    source_.on("-type f 2>/dev/null", "12\n");
    target_.on("-type f 2>/dev/null", "12\n");

    auto result = verifier_.verify(source_, target_, "/home/src/site", "/home/dst/site");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome, VerificationOutcome::Match);
    EXPECT_EQ(result->sourceFileCount, 12u);
    EXPECT_EQ(result->sourceDirCount, 3u);
    EXPECT_EQ(result->targetDirCount, 3u);
    EXPECT_EQ(result->deficit(), 0u);
    EXPECT_FALSE(source_.ran("-printf"));
}

TEST_F(VerifierTest, SurplusIsNotADeficit) {
    source_.on("-type f 2>/dev/null", "12\n");
    target_.on("-type f 2>/dev/null", "15\n");

    auto result = verifier_.verify(source_, target_, "/home/src/site", "/home/dst/site");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome, VerificationOutcome::Surplus);
    EXPECT_TRUE(result->missing.empty());
    EXPECT_EQ(toString(result->outcome), "Surplus");
}

// Test that a deficit identifies the missing relative paths
TEST_F(VerifierTest, DeficitListsMissingFiles) {
    source_.on("-type f 2>/dev/null", "4\n")
           .on("-printf", nulList({"index.php", "img/a b.png", "css/site.css", "notes\nmultiline.txt"}));
    target_.on("-type f 2>/dev/null", "2\n")
           .on("-printf", nulList({"index.php", "css/site.css"}));

    auto result = verifier_.verify(source_, target_, "/home/src/site", "/home/dst/site");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome, VerificationOutcome::Deficit);
    EXPECT_EQ(result->deficit(), 2u);
    EXPECT_EQ(result->missing, (MissingFileSet{"img/a b.png", "notes\nmultiline.txt"}));
    EXPECT_TRUE(source_.ran("find /home/src/site -type f -printf '%P\\0'"));
}

TEST_F(VerifierTest, DeficitWithoutListing) {
    source_.on("-type f 2>/dev/null", "4\n");
    target_.on("-type f 2>/dev/null", "3\n");

    auto result = verifier_.verify(source_, target_, "/home/src/site", "/home/dst/site", false);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->outcome, VerificationOutcome::Deficit);
    EXPECT_TRUE(result->missing.empty());
    EXPECT_FALSE(target_.ran("-printf"));
}

// Test that counting failures are fatal here, unlike in the prober
TEST_F(VerifierTest, CountFailureIsFatal) {
    source_.on("-type f 2>/dev/null", "12\n");
    target_.onError("-type f 2>/dev/null", "session closed");

    auto result = verifier_.verify(source_, target_, "/home/src/site", "/home/dst/site");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferErrorKind::VerificationDeficit);
    EXPECT_EQ(result.error().message, "Could not count files on dst.example.com:/home/dst/site: session closed");
}

TEST_F(VerifierTest, ParseNulSeparated) {
    std::string output("a\0b c\0\0d", 8);
    EXPECT_EQ(Verifier::parseNulSeparated(output), (MissingFileSet{"a", "b c", "d"}));
    EXPECT_TRUE(Verifier::parseNulSeparated("").empty());
}
