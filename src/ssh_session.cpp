#include "ssh_session.hpp"
#include <thread>
#include <utility>

namespace {

std::string libsshError(ssh_session session) {
    const char* msg = session ? ssh_get_error(session) : nullptr;
    return (msg && *msg) ? std::string(msg) : std::string("unknown libssh error");
}

bool verifyHostKey(ssh_session session, std::string& error) {
    switch (ssh_session_is_known_server(session)) {
        case SSH_KNOWN_HOSTS_OK:
            return true;
        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_NOT_FOUND:
            if (ssh_session_update_known_hosts(session) != SSH_OK) {
                error = "Failed to record host key: " + libsshError(session);
                return false;
            }
            return true;
        case SSH_KNOWN_HOSTS_CHANGED:
            error = "Host key does not match known_hosts";
            return false;
        case SSH_KNOWN_HOSTS_OTHER:
            error = "Host key type changed since it was recorded in known_hosts";
            return false;
        case SSH_KNOWN_HOSTS_ERROR:
        default:
            error = "Host key verification failed: " + libsshError(session);
            return false;
    }
}

} // namespace

SshExecution::SshExecution(ssh_channel channel) : channel_(channel) {}

SshExecution::~SshExecution() {
    if (!channel_) {
        return;
    }
    if (ssh_channel_is_open(channel_)) {
        ssh_channel_send_eof(channel_);
        ssh_channel_close(channel_);
    }
    ssh_channel_free(channel_);
}

std::expected<OutputChunk, std::string> SshExecution::readAvailable() {
    OutputChunk chunk;
    char buf[4096];
    for (int isStderr = 0; isStderr <= 1; ++isStderr) {
        while (true) {
            int n = ssh_channel_read_nonblocking(channel_, buf, sizeof(buf), isStderr);
            if (n == SSH_ERROR) {
                return std::unexpected(std::string("ssh_channel_read_nonblocking failed"));
            }
            if (n <= 0) {
                break;
            }
            (isStderr ? chunk.err : chunk.out).append(buf, static_cast<size_t>(n));
        }
    }
    return chunk;
}

bool SshExecution::exitStatusReady() {
    return ssh_channel_is_eof(channel_) != 0;
}

std::expected<int, std::string> SshExecution::finish() {
    ssh_channel_send_eof(channel_);
    int status = ssh_channel_get_exit_status(channel_);
    ssh_channel_close(channel_);
    if (status < 0) {
        return std::unexpected(std::string("Remote exit status unavailable"));
    }
    return status;
}

SshSession::SshSession(ssh_session session, std::string host)
    : session_(session), host_(std::move(host)) {}

SshSession::~SshSession() {
    close();
}

std::expected<std::unique_ptr<RemoteSession>, std::string> SshSession::open(const HostConfig& host,
                                                                           std::chrono::seconds connectTimeout) {
    if (host.host.empty() || host.username.empty()) {
        return std::unexpected(std::string("Host and user are required"));
    }

    ssh_session ssh = ssh_new();
    if (!ssh) {
        return std::unexpected(std::string("Failed to create SSH session"));
    }
    long timeout = static_cast<long>(connectTimeout.count());
    int port = host.port;
    ssh_options_set(ssh, SSH_OPTIONS_HOST, host.host.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh, SSH_OPTIONS_USER, host.username.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout);

    if (ssh_connect(ssh) != SSH_OK) {
        std::string error = "SSH connection failed: " + libsshError(ssh);
        ssh_free(ssh);
        return std::unexpected(error);
    }

    std::string hostKeyError;
    if (!verifyHostKey(ssh, hostKeyError)) {
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return std::unexpected(hostKeyError);
    }

    if (host.password.empty()) {
        if (ssh_userauth_publickey_auto(ssh, nullptr, nullptr) != SSH_AUTH_SUCCESS) {
            std::string error = "SSH public key authentication failed: " + libsshError(ssh);
            ssh_disconnect(ssh);
            ssh_free(ssh);
            return std::unexpected(error);
        }
    } else {
        if (ssh_userauth_password(ssh, nullptr, host.password.c_str()) != SSH_AUTH_SUCCESS) {
            std::string error = "SSH password authentication failed: " + libsshError(ssh);
            ssh_disconnect(ssh);
            ssh_free(ssh);
            return std::unexpected(error);
        }
    }

    return std::unique_ptr<RemoteSession>(new SshSession(ssh, host.host));
}

SessionConnector SshSession::connector(std::chrono::seconds connectTimeout) {
    return [connectTimeout](const HostConfig& host) { return SshSession::open(host, connectTimeout); };
}

void SshSession::close() {
    if (session_) {
        ssh_disconnect(session_);
        ssh_free(session_);
        session_ = nullptr;
    }
}

std::expected<std::unique_ptr<RemoteExecution>, std::string> SshSession::executeStreaming(const std::string& command) {
    if (!session_) {
        return std::unexpected(std::string("Not connected"));
    }

    ssh_channel channel = ssh_channel_new(session_);
    if (!channel) {
        return std::unexpected("ssh_channel_new failed: " + libsshError(session_));
    }
    if (ssh_channel_open_session(channel) != SSH_OK) {
        std::string error = "ssh_channel_open_session failed: " + libsshError(session_);
        ssh_channel_free(channel);
        return std::unexpected(error);
    }
    if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
        std::string error = "ssh_channel_request_exec failed: " + libsshError(session_);
        ssh_channel_close(channel);
        ssh_channel_free(channel);
        return std::unexpected(error);
    }
    return std::make_unique<SshExecution>(channel);
}

std::expected<CommandResult, std::string> SshSession::execute(const std::string& command,
                                                              std::chrono::seconds timeout) {
    auto execution = executeStreaming(command);
    if (!execution) {
        return std::unexpected(execution.error());
    }
    auto& running = **execution;

    CommandResult result;
    const auto started = std::chrono::steady_clock::now();
    while (true) {
        auto chunk = running.readAvailable();
        if (!chunk) {
            return std::unexpected(chunk.error());
        }
        result.out += chunk->out;
        result.err += chunk->err;

        if (running.exitStatusReady()) {
            break;
        }
        if (std::chrono::steady_clock::now() - started > timeout) {
            return std::unexpected("Remote command timed out after " + std::to_string(timeout.count()) + " s");
        }
        if (chunk->empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    auto tail = running.readAvailable();
    if (!tail) {
        return std::unexpected(tail.error());
    }
    result.out += tail->out;
    result.err += tail->err;

    auto status = running.finish();
    if (!status) {
        return std::unexpected(status.error());
    }
    result.exitCode = *status;
    return result;
}
