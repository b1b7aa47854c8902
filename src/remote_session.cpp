#include "remote_session.hpp"
#include <thread>

std::chrono::milliseconds backoffDelay(std::chrono::milliseconds baseDelay, int attempt) {
    auto delay = baseDelay;
    for (int i = 1; i < attempt; ++i) {
        delay *= 2;
    }
    return delay;
}

std::expected<std::unique_ptr<RemoteSession>, TransferError> connectWithBackoff(const SessionConnector& connector,
                                                                               const HostConfig& host,
                                                                               const ConnectPolicy& policy,
                                                                               const TransferLogger& logger) {
    const int attempts = policy.maxAttempts > 0 ? policy.maxAttempts : 1;
    std::string lastError = "no connection attempt was made";

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        logger.debug("Connecting to " + host.host + ":" + std::to_string(host.port) + " as " + host.username +
                     " (attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) + ")");
        auto session = connector(host);
        if (session) {
            logger.debug("SSH connection established to " + host.host);
            return std::move(*session);
        }

        lastError = session.error();
        logger.warning("SSH connection to " + host.host + " failed (attempt " + std::to_string(attempt) + "/" +
                       std::to_string(attempts) + "): " + lastError);

        if (attempt < attempts) {
            auto delay = backoffDelay(policy.baseDelay, attempt);
            if (policy.sleep) {
                policy.sleep(delay);
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    return std::unexpected(TransferError{TransferErrorKind::ConnectionError,
                                         "Failed to connect to " + host.host + " after " +
                                             std::to_string(attempts) + " attempts: " + lastError});
}
