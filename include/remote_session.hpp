/**
 * @file remote_session.hpp
 * @brief Narrow remote command execution interface used by the transfer pipeline.
 *
 * The pipeline only ever needs "run a shell command on a host and tell me how it
 * ended", in a buffered and a streaming flavour. Keeping that seam abstract lets
 * the orchestration run against a scripted session in tests and against libssh
 * (see ssh_session.hpp) in production.
 */

#ifndef REMOTE_SESSION_HPP
#define REMOTE_SESSION_HPP

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include "transfer_logger.hpp"
#include "transfer_types.hpp"

/**
 * @brief Output received from a streaming execution since the previous read.
 */
struct OutputChunk {
    std::string out; ///< New stdout bytes.
    std::string err; ///< New stderr bytes.

    bool empty() const { return out.empty() && err.empty(); }
};

/**
 * @brief A command running on a remote host whose output is read incrementally.
 *
 * Destroying the object releases the underlying channel.
 */
class RemoteExecution {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RemoteExecution() = default;

    /**
     * @brief Returns whatever output is available without blocking.
     *
     * @return std::expected<OutputChunk, std::string> Possibly empty chunk, or a transport error.
     */
    virtual std::expected<OutputChunk, std::string> readAvailable() = 0;

    /**
     * @brief True once the remote side has closed its output streams.
     */
    virtual bool exitStatusReady() = 0;

    /**
     * @brief Waits for the exit status after the output has been drained.
     *
     * @return std::expected<int, std::string> Remote exit code, or a transport error.
     */
    virtual std::expected<int, std::string> finish() = 0;
};

/**
 * @brief Authenticated command channel to one host.
 */
class RemoteSession {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RemoteSession() = default;

    /**
     * @brief Runs a command to completion and captures its output.
     *
     * A non-zero exit code is a normal result, not an error.
     *
     * @param command Shell command line (see ShellCommand).
     * @param timeout Maximum run time.
     * @return std::expected<CommandResult, std::string> Exit code and output, or a transport error / timeout.
     */
    virtual std::expected<CommandResult, std::string> execute(const std::string& command,
                                                              std::chrono::seconds timeout) = 0;

    /**
     * @brief Starts a command whose output is polled by the caller.
     *
     * @param command Shell command line.
     * @return std::expected<std::unique_ptr<RemoteExecution>, std::string> The running command or an error.
     */
    virtual std::expected<std::unique_ptr<RemoteExecution>, std::string> executeStreaming(const std::string& command) = 0;

    /**
     * @brief Closes the session; safe to call more than once.
     */
    virtual void close() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Host this session is connected to, for log messages.
     */
    virtual std::string host() const = 0;
};

/**
 * @brief A temporary file on one host that cleanup must remove.
 */
struct RemoteArtifact {
    RemoteSession* session; ///< Session of the host holding the file; not owned.
    std::string path; ///< Absolute path of the file.
};

/// Opens one session attempt for a host.
using SessionConnector =
    std::function<std::expected<std::unique_ptr<RemoteSession>, std::string>(const HostConfig&)>;

/**
 * @brief Retry schedule for connection attempts.
 */
struct ConnectPolicy {
    int maxAttempts = 3; ///< Attempts before giving up.
    std::chrono::milliseconds baseDelay{1000}; ///< Delay after the first failure; doubles each time.
    std::function<void(std::chrono::milliseconds)> sleep; ///< Sleep hook; std::this_thread::sleep_for when empty.
};

/**
 * @brief Connects to a host, retrying with exponential backoff.
 *
 * @param connector Attempt function.
 * @param host Host to reach.
 * @param policy Attempt cap and base delay.
 * @param logger Receives one warning per failed attempt.
 * @return std::expected<std::unique_ptr<RemoteSession>, TransferError> The session, or a ConnectionError
 *         carrying the last attempt's message.
 */
std::expected<std::unique_ptr<RemoteSession>, TransferError> connectWithBackoff(const SessionConnector& connector,
                                                                               const HostConfig& host,
                                                                               const ConnectPolicy& policy,
                                                                               const TransferLogger& logger);

/**
 * @brief Delay before retry number @p attempt (1-based): base * 2^(attempt-1).
 */
std::chrono::milliseconds backoffDelay(std::chrono::milliseconds baseDelay, int attempt);

#endif // REMOTE_SESSION_HPP
