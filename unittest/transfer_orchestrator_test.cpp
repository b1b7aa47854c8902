#include <gtest/gtest.h>
#include "fake_remote_session.hpp"
#include "transfer_api.hpp"
#include "transfer_orchestrator.hpp"
#include <algorithm>

class TransferOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.source.host = "src.example.com";
        config_.source.username = "deploy";
        config_.source.password = "secret";
        config_.target.host = "dst.example.com";
        config_.target.username = "deploy";
        config_.path = "public_html";
        config_.connectAttempts = 2;
        config_.connectBaseDelay = std::chrono::milliseconds(0);
        config_.pollInterval = std::chrono::milliseconds(1);

        source_ = std::make_shared<FakeRemoteSession>("src.example.com");
        target_ = std::make_shared<FakeRemoteSession>("dst.example.com");

        source_->on("pwd", "/home/src\n")
                .on("du -sb", "2048\n")
                .on("-type f 2>/dev/null", "3\n")
                .on("-type d 2>/dev/null", "2\n")
                .on("stat -c", "1024\n");
        target_->on("pwd", "/home/dst\n")
                .on("-type f 2>/dev/null", "3\n")
                .on("-type d 2>/dev/null", "2\n");
    }

    TransferReport runTransfer() {
        TransferOrchestrator orchestrator(config_, fakeConnector({{"src.example.com", source_},
                                                                  {"dst.example.com", target_}}),
                                          logger_);
        orchestrator.onStateChange([this](TransferState state) { states_.push_back(state); });
        TransferReport report = orchestrator.run();
        history_ = orchestrator.stateHistory();
        return report;
    }

    bool visited(TransferState state) const {
        return std::find(history_.begin(), history_.end(), state) != history_.end();
    }

    static bool contains(const std::vector<std::string>& entries, const std::string& needle) {
        return std::any_of(entries.begin(), entries.end(),
                           [&](const std::string& entry) { return entry.find(needle) != std::string::npos; });
    }

    TransferLogger logger_{"", LogLevel::Error, false};
    TransferConfig config_;
    std::shared_ptr<FakeRemoteSession> source_;
    std::shared_ptr<FakeRemoteSession> target_;
    std::vector<TransferState> states_;
    std::vector<TransferState> history_;
};

// Test a transfer that verifies on the first pass
TEST_F(TransferOrchestratorTest, HappyPath) {
    TransferReport report = runTransfer();

    EXPECT_TRUE(report.success()) << report.joinedErrors();
    EXPECT_TRUE(report.isComplete());
    EXPECT_EQ(report.finalState(), TransferState::Completed);
    std::vector<TransferState> expected{TransferState::Init,       TransferState::Connecting,
                                        TransferState::Probing,    TransferState::Archiving,
                                        TransferState::Retrieving, TransferState::Extracting,
                                        TransferState::Verifying,  TransferState::CleaningUp,
                                        TransferState::Completed};
    EXPECT_EQ(history_, expected);
    EXPECT_EQ(states_, expected);

    EXPECT_EQ(report.protocol(), "SSH");
    EXPECT_EQ(report.sourcePath(), "/home/src/public_html");
    EXPECT_EQ(report.targetPath(), "/home/dst/public_html");
    EXPECT_EQ(report.totalSizeBytes(), 2048u);
    EXPECT_EQ(report.transferredSizeBytes(), 2048u);
    EXPECT_EQ(report.fileCount(), 3u);
    EXPECT_EQ(report.directoryCount(), 1u);
    EXPECT_EQ(report.sourceFileCount(), 3u);
    EXPECT_TRUE(report.warnings().empty());

    EXPECT_TRUE(source_->ran("cd /home/src && tar czf /home/src/tmp_trans/public_html_"));
    EXPECT_TRUE(target_->ran("wget --progress=bar:force --timeout=300 --tries=3"));
    EXPECT_TRUE(target_->ran("-C /home/dst"));
    EXPECT_EQ(source_->count("rm -- /home/src/tmp_trans/public_html_"), 1);
    EXPECT_EQ(target_->count("rm -- /home/dst/tmp_trans/public_html_"), 1);
    EXPECT_EQ(source_->closeCount(), 1);
    EXPECT_EQ(target_->closeCount(), 1);
}

// Test that a failed download ends the run without recovery
TEST_F(TransferOrchestratorTest, RetrievalFailureSkipsRecovery) {
    target_->onStream("wget", {OutputChunk{"", "No such file 'public_html.tar.gz'.\n"}}, 8);

    TransferReport report = runTransfer();
    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.finalState(), TransferState::Failed);
    EXPECT_FALSE(visited(TransferState::Extracting));
    EXPECT_FALSE(visited(TransferState::Recovering));
    EXPECT_TRUE(visited(TransferState::CleaningUp));
    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0].rfind("RetrievalError: Failed to download public_html_", 0), 0u);
    EXPECT_EQ(report.transferredSizeBytes(), 0u);
    EXPECT_TRUE(source_->ran("rm --"));
    EXPECT_TRUE(target_->ran("rm --"));
}

// Test that one recovery pass closes a deficit
TEST_F(TransferOrchestratorTest, RecoveryClosesDeficit) {
    source_->on("-printf", nulList({"index.php", "css/site.css", "img/logo.png"}));
    target_->onSequence("-type f 2>/dev/null", {"1\n", "3\n"})
            .on("-printf", nulList({"index.php"}));

    TransferReport report = runTransfer();
    EXPECT_TRUE(report.success()) << report.joinedErrors();
    EXPECT_TRUE(visited(TransferState::Recovering));
    EXPECT_EQ(report.fileCount(), 3u);

    EXPECT_TRUE(source_->ran("printf '%s\\0' css/site.css img/logo.png >>"));
    EXPECT_TRUE(source_->ran("--null -T /home/src/tmp_trans/public_html_recovery_"));
    EXPECT_TRUE(target_->ran("--tries=2"));
    EXPECT_TRUE(target_->ran("-C /home/dst/public_html"));
    EXPECT_EQ(target_->count("wget"), 2);
    EXPECT_EQ(source_->count("rm --"), 3);
    EXPECT_EQ(target_->count("rm --"), 2);
}

// Test that a deficit left after recovery fails the run
TEST_F(TransferOrchestratorTest, ResidualDeficitFails) {
    source_->on("-printf", nulList({"index.php", "css/site.css", "img/logo.png"}));
    target_->onSequence("-type f 2>/dev/null", {"1\n", "2\n"})
            .on("-printf", nulList({"index.php"}));

    TransferReport report = runTransfer();
    EXPECT_FALSE(report.success());
    EXPECT_EQ(report.finalState(), TransferState::Failed);
    EXPECT_TRUE(contains(report.errors(), "RecoveryIncomplete: 1 files still missing after recovery"));
    EXPECT_EQ(report.fileCount(), 2u);
    EXPECT_EQ(target_->count("wget"), 2);
}

TEST_F(TransferOrchestratorTest, DeficitWithoutMissingPathsFails) {
    target_->on("-type f 2>/dev/null", "2\n");
    source_->on("-printf", nulList({"index.php"}));
    target_->on("-printf", nulList({"index.php"}));

    TransferReport report = runTransfer();
    EXPECT_FALSE(report.success());
    EXPECT_FALSE(visited(TransferState::Recovering));
    EXPECT_TRUE(contains(report.errors(), "Target lacks 1 files but no missing path could be identified"));
}

// Test that cleanup problems are warnings only
TEST_F(TransferOrchestratorTest, CleanupFailureIsWarning) {
    target_->on("rm --", "", 1, "rm: cannot remove: Permission denied\n");

    TransferReport report = runTransfer();
    EXPECT_TRUE(report.success());
    ASSERT_EQ(report.warnings().size(), 1u);
    EXPECT_EQ(report.warnings()[0].rfind("CleanupWarning: Failed to remove dst.example.com:/home/dst/tmp_trans/", 0),
              0u);
    EXPECT_NE(report.warnings()[0].find("(exit code 1: rm: cannot remove: Permission denied)"), std::string::npos);
}

TEST_F(TransferOrchestratorTest, CleanupCanBeDisabled) {
    config_.cleanupTempFiles = false;
    TransferReport report = runTransfer();
    EXPECT_TRUE(report.success());
    EXPECT_FALSE(source_->ran("rm --"));
    EXPECT_FALSE(target_->ran("rm --"));
}

TEST_F(TransferOrchestratorTest, SurplusIsWarning) {
    target_->on("-type f 2>/dev/null", "5\n");

    TransferReport report = runTransfer();
    EXPECT_TRUE(report.success());
    EXPECT_FALSE(visited(TransferState::Recovering));
    EXPECT_TRUE(contains(report.warnings(), "Target has 2 extra files"));
}

// Test warnings from probing
TEST_F(TransferOrchestratorTest, ProbeWarnings) {
    source_->on("du -sb", "", 1);
    TransferReport report = runTransfer();
    EXPECT_TRUE(report.success());
    EXPECT_EQ(report.totalSizeBytes(), 0u);
    EXPECT_TRUE(contains(report.warnings(), "ProbeDegraded: Could not determine size of src.example.com:"));
}

TEST_F(TransferOrchestratorTest, EmptySourceIsWarning) {
    source_->on("-type f 2>/dev/null", "0\n");
    target_->on("-type f 2>/dev/null", "0\n");

    TransferReport report = runTransfer();
    EXPECT_TRUE(report.success());
    EXPECT_TRUE(contains(report.warnings(), "Source directory appears to be empty"));
}

// Test cancellation between steps
TEST_F(TransferOrchestratorTest, CancellationCleansUp) {
    TransferOrchestrator orchestrator(config_, fakeConnector({{"src.example.com", source_},
                                                              {"dst.example.com", target_}}),
                                      logger_);
    orchestrator.setCancelPredicate([&orchestrator] { return orchestrator.state() == TransferState::Archiving; });

    TransferReport report = orchestrator.run();
    EXPECT_FALSE(report.success());
    std::vector<TransferState> expected{TransferState::Init,      TransferState::Connecting,
                                        TransferState::Probing,   TransferState::Archiving,
                                        TransferState::CleaningUp, TransferState::Failed};
    EXPECT_EQ(orchestrator.stateHistory(), expected);
    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0], "Cancelled: Transfer cancelled by user");
    EXPECT_FALSE(target_->ran("wget"));
    EXPECT_TRUE(source_->ran("rm -- /home/src/tmp_trans/public_html_"));
    EXPECT_EQ(source_->closeCount(), 1);
}

TEST_F(TransferOrchestratorTest, ConnectionFailure) {
    config_.target.host = "unreachable.example.com";

    TransferReport report = runTransfer();
    EXPECT_FALSE(report.success());
    std::vector<TransferState> expected{TransferState::Init, TransferState::Connecting, TransferState::CleaningUp,
                                        TransferState::Failed};
    EXPECT_EQ(history_, expected);
    ASSERT_EQ(report.errors().size(), 1u);
    EXPECT_EQ(report.errors()[0],
              "ConnectionError: Failed to connect to unreachable.example.com after 2 attempts: Connection refused");
    EXPECT_EQ(source_->closeCount(), 1);
}

TEST_F(TransferOrchestratorTest, HomeDirectoryMustBeAbsolute) {
    target_->on("pwd", "", 1);
    TransferReport report = runTransfer();
    EXPECT_FALSE(report.success());
    EXPECT_TRUE(contains(report.errors(), "Could not determine home directory on dst.example.com"));
}

// Test the static entry point
TEST_F(TransferOrchestratorTest, ApiRejectsInvalidConfig) {
    config_.path.clear();
    auto report = TransferAPI::startTransfer(config_, fakeConnector({}), logger_, nullptr, nullptr);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error(), "Failed to start transfer: Missing required config field: path");
}

TEST_F(TransferOrchestratorTest, ApiRunsTransfer) {
    auto report = TransferAPI::startTransfer(
        config_, fakeConnector({{"src.example.com", source_}, {"dst.example.com", target_}}), logger_, nullptr,
        [] { return false; });
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->success());
}
