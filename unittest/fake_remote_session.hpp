#ifndef FAKE_REMOTE_SESSION_HPP
#define FAKE_REMOTE_SESSION_HPP

#include <deque>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "remote_session.hpp"

/**
 * @brief Scripted RemoteSession for tests.
 *
 * Commands are answered by the rule with the longest needle contained in the
 * command text. Registering a needle again replaces its responses. A rule
 * answers with its responses in order and repeats the last one. Unmatched
 * commands succeed with empty output.
 */
class FakeRemoteSession : public RemoteSession {
public:
    explicit FakeRemoteSession(std::string host = "fake-host");

    /// Answers matching commands with @p out and @p exitCode.
    FakeRemoteSession& on(const std::string& needle, const std::string& out, int exitCode = 0,
                          const std::string& err = {});

    /// Answers successive matching commands with @p outputs, exit code 0.
    FakeRemoteSession& onSequence(const std::string& needle, const std::vector<std::string>& outputs);

    /// Answers matching commands with a transport error.
    FakeRemoteSession& onError(const std::string& needle, const std::string& error);

    /// Streams @p chunks for matching streaming commands, then exits with @p exitCode.
    FakeRemoteSession& onStream(const std::string& needle, std::vector<OutputChunk> chunks, int exitCode = 0);

    /// Matching streaming commands never report completion.
    FakeRemoteSession& onHangingStream(const std::string& needle);

    std::expected<CommandResult, std::string> execute(const std::string& command,
                                                      std::chrono::seconds timeout) override;
    std::expected<std::unique_ptr<RemoteExecution>, std::string> executeStreaming(const std::string& command) override;
    void close() override;
    bool isConnected() const override { return connected_; }
    std::string host() const override { return host_; }

    /// Every command received, buffered and streamed, in order.
    const std::vector<std::string>& commands() const { return commands_; }

    /// Number of received commands containing @p needle.
    int count(const std::string& needle) const;

    bool ran(const std::string& needle) const { return count(needle) > 0; }

    int closeCount() const { return closeCount_; }

private:
    struct Rule {
        std::string needle;
        std::deque<std::expected<CommandResult, std::string>> responses;
    };

    struct StreamRule {
        std::string needle;
        std::vector<OutputChunk> chunks;
        int exitCode = 0;
        bool hangs = false;
    };

    Rule& ruleFor(const std::string& needle);

    std::string host_;
    bool connected_ = true;
    int closeCount_ = 0;
    std::vector<Rule> rules_;
    std::vector<StreamRule> streamRules_;
    std::vector<std::string> commands_;
};

/**
 * @brief Forwards to a FakeRemoteSession the test keeps after the run has released its handle.
 */
class SharedSessionHandle : public RemoteSession {
public:
    explicit SharedSessionHandle(std::shared_ptr<FakeRemoteSession> session) : session_(std::move(session)) {}

    std::expected<CommandResult, std::string> execute(const std::string& command,
                                                      std::chrono::seconds timeout) override {
        return session_->execute(command, timeout);
    }
    std::expected<std::unique_ptr<RemoteExecution>, std::string> executeStreaming(const std::string& command) override {
        return session_->executeStreaming(command);
    }
    void close() override { session_->close(); }
    bool isConnected() const override { return session_->isConnected(); }
    std::string host() const override { return session_->host(); }

private:
    std::shared_ptr<FakeRemoteSession> session_;
};

/**
 * @brief Connector handing out the session registered for each host name.
 *
 * Hosts without a session fail with "Connection refused".
 */
SessionConnector fakeConnector(std::map<std::string, std::shared_ptr<FakeRemoteSession>> sessions);

/**
 * @brief Joins entries with NUL terminators, as `find -printf '%P\0'` prints them.
 */
std::string nulList(const std::vector<std::string>& entries);

#endif // FAKE_REMOTE_SESSION_HPP
