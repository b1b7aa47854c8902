/**
 * @file directory_prober.hpp
 * @brief Remote directory measurement for SiteRelay.
 *
 * Measures size, file count and directory count of a remote path with the
 * host's own counting utilities (`du`, `find`, `wc`), so no listing is ever
 * held in memory.
 */

#ifndef DIRECTORY_PROBER_HPP
#define DIRECTORY_PROBER_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "remote_session.hpp"
#include "shell_command.hpp"
#include "transfer_logger.hpp"
#include "transfer_types.hpp"

/**
 * @brief Snapshot plus the sub-probes that had to be degraded to zero.
 */
struct ProbeOutcome {
    DirectorySnapshot snapshot; ///< Measured values; degraded fields are zero.
    std::vector<TransferError> degraded; ///< One ProbeDegraded entry per failed sub-probe.
};

/**
 * @brief Best-effort measurement of remote directories.
 */
class DirectoryProber {
public:
    /**
     * @brief Constructs a prober.
     *
     * @param logger Receives debug output and degradation warnings.
     * @param timeout Per-command timeout for the counting commands.
     */
    DirectoryProber(const TransferLogger& logger, std::chrono::seconds timeout);

    /**
     * @brief Measures a directory.
     *
     * Runs the size, file count and directory count probes independently. A
     * sub-probe that fails (transport error, timeout, non-zero exit or
     * non-numeric output) yields zero for its field and a ProbeDegraded entry;
     * the probe itself never fails.
     *
     * @param session Session of the host that owns the path.
     * @param path Absolute remote path.
     * @return ProbeOutcome The snapshot and any degradations.
     * @note The directory count includes @p path itself.
     */
    ProbeOutcome probe(RemoteSession& session, const std::string& path) const;

    /**
     * @brief Summed disk usage of a path in bytes (`du -sb`).
     */
    std::expected<std::uint64_t, std::string> totalSize(RemoteSession& session, const std::string& path) const;

    /**
     * @brief Number of regular files below a path (`find -type f | wc -l`).
     */
    std::expected<std::uint64_t, std::string> fileCount(RemoteSession& session, const std::string& path) const;

    /**
     * @brief Number of directories below a path, the path itself included (`find -type d | wc -l`).
     */
    std::expected<std::uint64_t, std::string> directoryCount(RemoteSession& session, const std::string& path) const;

    /**
     * @brief Parses the single number a counting command prints.
     *
     * @param text Command output, surrounding whitespace allowed.
     * @return std::optional<std::uint64_t> The value, or std::nullopt if @p text is not a plain non-negative integer.
     */
    static std::optional<std::uint64_t> parseCount(const std::string& text);

    std::chrono::seconds timeout() const { return timeout_; }

private:
    std::expected<std::uint64_t, std::string> runCount(RemoteSession& session, const ShellCommand& command) const;

    ShellCommand countCommand(const std::string& path, const std::string& type) const;

    const TransferLogger& logger_; ///< Shared run logger.
    std::chrono::seconds timeout_; ///< Per-command timeout.
};

#endif // DIRECTORY_PROBER_HPP
