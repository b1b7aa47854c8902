/**
 * @file ssh_session.hpp
 * @brief libssh implementation of RemoteSession.
 *
 * Opens an SSH connection with password or public key authentication and runs
 * commands on exec channels, either buffered with a timeout or streamed with
 * non-blocking reads.
 *
 * @note Requires libssh. Install via apt (libssh-dev) on Linux or Homebrew on macOS.
 */

#ifndef SSH_SESSION_HPP
#define SSH_SESSION_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <libssh/libssh.h>
#include "remote_session.hpp"

/**
 * @brief A command running on an SSH exec channel.
 */
class SshExecution : public RemoteExecution {
public:
    /**
     * @brief Takes ownership of an exec channel that already started its command.
     */
    explicit SshExecution(ssh_channel channel);
    ~SshExecution() override;

    SshExecution(const SshExecution&) = delete;
    SshExecution& operator=(const SshExecution&) = delete;

    std::expected<OutputChunk, std::string> readAvailable() override;
    bool exitStatusReady() override;
    std::expected<int, std::string> finish() override;

private:
    ssh_channel channel_; ///< Owned exec channel.
};

/**
 * @brief SSH connection to one host.
 */
class SshSession : public RemoteSession {
public:
    /**
     * @brief Connects and authenticates.
     *
     * Authenticates with the password when one is configured, otherwise with the
     * agent or default keys. Unknown host keys are recorded in known_hosts; a
     * changed host key aborts the connection.
     *
     * @param host Host identity and credentials.
     * @param connectTimeout TCP connect and handshake timeout.
     * @return std::expected<std::unique_ptr<RemoteSession>, std::string> The session or an error message.
     */
    static std::expected<std::unique_ptr<RemoteSession>, std::string> open(const HostConfig& host,
                                                                          std::chrono::seconds connectTimeout);

    /**
     * @brief Returns a connector that opens SshSessions with the given timeout.
     */
    static SessionConnector connector(std::chrono::seconds connectTimeout);

    ~SshSession() override;

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    std::expected<CommandResult, std::string> execute(const std::string& command,
                                                      std::chrono::seconds timeout) override;
    std::expected<std::unique_ptr<RemoteExecution>, std::string> executeStreaming(const std::string& command) override;
    void close() override;
    bool isConnected() const override { return session_ != nullptr; }
    std::string host() const override { return host_; }

private:
    SshSession(ssh_session session, std::string host);

    ssh_session session_; ///< Connected libssh session; nullptr once closed.
    std::string host_; ///< Host name for diagnostics.
};

#endif // SSH_SESSION_HPP
