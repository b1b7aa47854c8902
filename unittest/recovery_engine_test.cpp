#include <gtest/gtest.h>
#include "fake_remote_session.hpp"
#include "recovery_engine.hpp"

class RecoveryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        PackerOptions packerOptions;
        packerOptions.timestamp = [] { return std::string("20250102_030405"); };
        packer_ = std::make_unique<ArchivePacker>(logger_, packerOptions);

        RetrieverOptions retrieverOptions;
        retrieverOptions.tries = 2;
        retrieverOptions.sleep = [](std::chrono::milliseconds) {};
        retriever_ = std::make_unique<ArtifactRetriever>(logger_, nullptr, retrieverOptions);

        engine_ = std::make_unique<RecoveryEngine>(*packer_, *retriever_, extractor_, verifier_, logger_);

        context_.sourceHome = "/home/src";
        context_.targetHome = "/home/dst";
        context_.sourcePath = "/home/src/public_html";
        context_.targetPath = "/home/dst/public_html";
        context_.bulkSource.host = "src.example.com";
        context_.bulkSource.username = "deploy";
        context_.bulkSource.password = "secret";

        source_.on("-type f 2>/dev/null", "10\n").on("-type d 2>/dev/null", "3\n");
        target_.on("-type d 2>/dev/null", "3\n");
    }

    TransferLogger logger_{"", LogLevel::Error, false};
    DirectoryProber prober_{logger_, std::chrono::seconds(30)};
    Extractor extractor_{logger_, std::chrono::seconds(600), std::chrono::seconds(120)};
    Verifier verifier_{prober_, logger_};
    std::unique_ptr<ArchivePacker> packer_;
    std::unique_ptr<ArtifactRetriever> retriever_;
    std::unique_ptr<RecoveryEngine> engine_;
    RecoveryContext context_;
    FakeRemoteSession source_{"src.example.com"};
    FakeRemoteSession target_{"dst.example.com"};
    std::vector<RemoteArtifact> artifacts_;
};

// Test a recovery pass that closes the gap
TEST_F(RecoveryEngineTest, RecoversMissingFiles) {
    target_.on("-type f 2>/dev/null", "10\n");

    auto result = engine_->recover(source_, target_, context_, {"a.txt", "img/b.png"}, artifacts_);
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_TRUE(result->resolved);
    EXPECT_EQ(result->residual(), 0u);
    EXPECT_EQ(result->plan.missingPaths.size(), 2u);
    EXPECT_EQ(result->plan.archive.fileName, "public_html_recovery_20250102_030405.tar.gz");

    EXPECT_TRUE(source_.ran("printf '%s\\0' a.txt img/b.png >>"));
    EXPECT_TRUE(target_.ran("--tries=2"));
    EXPECT_TRUE(target_.ran("tar -xzvf /home/dst/tmp_trans/public_html_recovery_20250102_030405.tar.gz "
                            "-C /home/dst/public_html"));

    ASSERT_EQ(artifacts_.size(), 3u);
    EXPECT_EQ(artifacts_[0].path, "/home/src/tmp_trans/public_html_recovery_20250102_030405.list");
    EXPECT_EQ(artifacts_[1].path, "/home/src/tmp_trans/public_html_recovery_20250102_030405.tar.gz");
    EXPECT_EQ(artifacts_[2].session, &target_);
    EXPECT_EQ(artifacts_[2].path, "/home/dst/tmp_trans/public_html_recovery_20250102_030405.tar.gz");
}

// Test that a residual deficit is reported, not retried
TEST_F(RecoveryEngineTest, ReportsResidualDeficit) {
    target_.on("-type f 2>/dev/null", "9\n");

    auto result = engine_->recover(source_, target_, context_, {"a.txt", "img/b.png"}, artifacts_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->resolved);
    EXPECT_EQ(result->residual(), 1u);
    EXPECT_EQ(target_.count("wget"), 1);
    EXPECT_FALSE(target_.ran("-printf"));
}

TEST_F(RecoveryEngineTest, PackFailureRegistersPlannedArtifacts) {
    source_.on("tar czf", "", 2);

    auto result = engine_->recover(source_, target_, context_, {"a.txt"}, artifacts_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferErrorKind::PackError);
    EXPECT_EQ(artifacts_.size(), 2u);
    EXPECT_FALSE(target_.ran("wget"));
}

TEST_F(RecoveryEngineTest, EmptyMissingSetIsRejected) {
    auto result = engine_->recover(source_, target_, context_, {}, artifacts_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, TransferErrorKind::RecoveryIncomplete);
    EXPECT_TRUE(source_.commands().empty());
}
