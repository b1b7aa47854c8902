#include <gtest/gtest.h>
#include "fake_remote_session.hpp"
#include "remote_session.hpp"
#include <vector>

class RemoteSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        host_.host = "src.example.com";
        host_.username = "deploy";
        policy_.maxAttempts = 3;
        policy_.baseDelay = std::chrono::milliseconds(100);
        policy_.sleep = [this](std::chrono::milliseconds delay) { delays_.push_back(delay); };
    }

    TransferLogger logger_{"", LogLevel::Error, false};
    HostConfig host_;
    ConnectPolicy policy_;
    std::vector<std::chrono::milliseconds> delays_;
    int attempts_ = 0;
};

// Test exponential backoff delays
TEST_F(RemoteSessionTest, BackoffDoubles) {
    EXPECT_EQ(backoffDelay(std::chrono::milliseconds(1000), 1), std::chrono::milliseconds(1000));
    EXPECT_EQ(backoffDelay(std::chrono::milliseconds(1000), 2), std::chrono::milliseconds(2000));
    EXPECT_EQ(backoffDelay(std::chrono::milliseconds(1000), 3), std::chrono::milliseconds(4000));
}

// Test that a later attempt succeeding returns the session
TEST_F(RemoteSessionTest, ConnectsAfterRetry) {
    SessionConnector connector = [this](const HostConfig& host)
        -> std::expected<std::unique_ptr<RemoteSession>, std::string> {
        if (++attempts_ < 2) {
            return std::unexpected(std::string("Connection refused"));
        }
        return std::make_unique<FakeRemoteSession>(host.host);
    };

    auto session = connectWithBackoff(connector, host_, policy_, logger_);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ((*session)->host(), "src.example.com");
    EXPECT_EQ(attempts_, 2);
    ASSERT_EQ(delays_.size(), 1u);
    EXPECT_EQ(delays_[0], std::chrono::milliseconds(100));
}

// Test exhaustion reports the last attempt's error
TEST_F(RemoteSessionTest, GivesUpAfterMaxAttempts) {
    SessionConnector connector = [this](const HostConfig&)
        -> std::expected<std::unique_ptr<RemoteSession>, std::string> {
        ++attempts_;
        return std::unexpected("Authentication failed (try " + std::to_string(attempts_) + ")");
    };

    auto session = connectWithBackoff(connector, host_, policy_, logger_);
    ASSERT_FALSE(session.has_value());
    EXPECT_EQ(session.error().kind, TransferErrorKind::ConnectionError);
    EXPECT_EQ(session.error().message,
              "Failed to connect to src.example.com after 3 attempts: Authentication failed (try 3)");
    EXPECT_EQ(attempts_, 3);
    ASSERT_EQ(delays_.size(), 2u);
    EXPECT_EQ(delays_[1], std::chrono::milliseconds(200));
}

TEST_F(RemoteSessionTest, ErrorDescribeIncludesKind) {
    TransferError error{TransferErrorKind::PackError, "Archive was not created"};
    EXPECT_EQ(error.describe(), "PackError: Archive was not created");
    EXPECT_EQ(toString(TransferState::CleaningUp), "CleaningUp");
}
