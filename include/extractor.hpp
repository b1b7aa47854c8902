/**
 * @file extractor.hpp
 * @brief Unpacks retrieved archives on the target host.
 */

#ifndef EXTRACTOR_HPP
#define EXTRACTOR_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include "remote_session.hpp"
#include "transfer_logger.hpp"
#include "transfer_types.hpp"

/**
 * @brief Outcome of a successful extraction.
 */
struct ExtractResult {
    std::string destination; ///< Directory the archive was unpacked into.
    std::size_t entries = 0; ///< Entries tar reported while unpacking.
};

/**
 * @brief Extracts tar.gz artifacts with the remote host's `tar`.
 *
 * There is no rollback: a failed extraction may leave the destination partly
 * populated, which the verifier and recovery pass deal with at file level.
 */
class Extractor {
public:
    /**
     * @brief Constructs an extractor.
     *
     * @param logger Run logger.
     * @param timeout Timeout of the tar command.
     * @param commandTimeout Timeout of the destination mkdir.
     */
    Extractor(const TransferLogger& logger, std::chrono::seconds timeout, std::chrono::seconds commandTimeout);

    /**
     * @brief Unpacks an artifact into a destination directory.
     *
     * Runs `mkdir -p <destination>` then `tar -xzvf <archive> -C <destination>`.
     *
     * @param target Session of the host holding the artifact.
     * @param artifact Artifact on that host.
     * @param destinationParent Directory to unpack into; created when missing.
     * @return std::expected<ExtractResult, TransferError> The result or an ExtractError.
     */
    std::expected<ExtractResult, TransferError> extract(RemoteSession& target,
                                                        const ArchiveDescriptor& artifact,
                                                        const std::string& destinationParent) const;

private:
    const TransferLogger& logger_; ///< Shared run logger.
    std::chrono::seconds timeout_; ///< tar timeout.
    std::chrono::seconds commandTimeout_; ///< mkdir timeout.
};

#endif // EXTRACTOR_HPP
