/**
 * @file artifact_retriever.hpp
 * @brief Cross-host artifact retrieval with live progress observation.
 *
 * The target host pulls the archive from the source host's FTP service with
 * `wget`. While the command runs, its output stream is polled without
 * blocking and every progress line is turned into a ProgressSample.
 *
 * @note Requires wget on the target host and an FTP service on the source host.
 */

#ifndef ARTIFACT_RETRIEVER_HPP
#define ARTIFACT_RETRIEVER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "remote_session.hpp"
#include "shell_command.hpp"
#include "transfer_logger.hpp"
#include "transfer_types.hpp"

/**
 * @brief Parses one status line of the retrieval tool.
 *
 * Recognizes lines of the shape
 * `[label] NN%[bar] <size> <rate>/s [eta <time>]`, for example
 * `archive.tar.gz    45%[===========>        ] 12.3M  892KB/s   eta 15s`.
 *
 * A percentage above 100 or a number too large to represent makes the line
 * a non-progress line. An unreadable ETA leaves etaSeconds empty.
 *
 * @param line One output fragment without line terminators.
 * @return std::optional<ProgressSample> The sample, or std::nullopt if the line is not a progress line.
 */
std::optional<ProgressSample> parseProgressLine(std::string_view line);

/**
 * @brief True for lines that look like progress output and are kept out of error text.
 *
 * Matches the bar style (`45%[==>   ]`) and the dot style
 * (`  1024K .......... 50%`). FTP dialogue such as `==> RETR ...` is not progress.
 */
bool looksLikeProgress(std::string_view line);

/**
 * @brief Converts a size token such as "12.3M" or "1,5G" into bytes (binary units).
 */
std::optional<double> parseSizeToken(std::string_view token);

/**
 * @brief Converts an ETA token such as "1h 2m" or "15s" into seconds.
 */
std::optional<std::uint64_t> parseEtaToken(std::string_view token);

/**
 * @brief Splits a byte stream into lines on '\\r' and '\\n'.
 *
 * Text after the last terminator is kept until more data or flush() arrives,
 * so a progress line split across two reads is parsed once, whole.
 */
class LineSplitter {
public:
    /**
     * @brief Adds data and returns the lines it completed.
     */
    std::vector<std::string> feed(std::string_view data);

    /**
     * @brief Returns the pending partial line, if any, and clears it.
     */
    std::optional<std::string> flush();

private:
    std::string pending_; ///< Unterminated tail of the stream.
};

/**
 * @brief Settings of the artifact retriever.
 */
struct RetrieverOptions {
    std::string stagingDir = "tmp_trans"; ///< Staging directory on both hosts, relative to home unless absolute.
    std::chrono::milliseconds pollInterval{100}; ///< Sleep between idle polls.
    std::chrono::seconds logInterval{5}; ///< Minimum spacing of progress log entries.
    std::chrono::seconds timeout{1800}; ///< Overall retrieval timeout.
    std::chrono::seconds commandTimeout{120}; ///< Timeout of the staging mkdir.
    int tries = 3; ///< wget --tries.
    int networkTimeout = 300; ///< wget --timeout in seconds.
    std::function<void(std::chrono::milliseconds)> sleep; ///< Sleep hook; std::this_thread::sleep_for when empty.
};

/**
 * @brief Outcome of a successful retrieval.
 */
struct RetrievalResult {
    ArchiveDescriptor artifact; ///< The artifact as it now exists on the target host.
    std::size_t sampleCount = 0; ///< Progress samples observed.
    std::optional<ProgressSample> lastSample; ///< Final progress sample, if any.
    std::chrono::milliseconds elapsed{0}; ///< Wall time of the pull.
};

/**
 * @brief Makes the target host fetch an artifact from the source host.
 */
class ArtifactRetriever {
public:
    /**
     * @brief Constructs a retriever.
     *
     * @param logger Run logger; receives at most one progress entry per log interval.
     * @param observer Receives every progress sample; may be nullptr.
     * @param options Polling, timeout and wget settings.
     */
    ArtifactRetriever(const TransferLogger& logger, ProgressObserver* observer, RetrieverOptions options);

    /**
     * @brief Pulls an artifact into the target staging directory.
     *
     * The pull is retried only by wget's own --tries. A transport error, a
     * non-zero exit or exceeding the retrieval timeout is a RetrievalError
     * whose message carries the tool's non-progress output.
     *
     * @param target Target session.
     * @param source FTP coordinates of the source host.
     * @param descriptor Artifact on the source host.
     * @param targetHome Home directory of the target session.
     * @return std::expected<RetrievalResult, TransferError> The retrieved artifact or a RetrievalError.
     */
    std::expected<RetrievalResult, TransferError> retrieve(RemoteSession& target,
                                                           const BulkTransferSource& source,
                                                           const ArchiveDescriptor& descriptor,
                                                           const std::string& targetHome) const;

    /**
     * @brief Path the artifact will have on the target host.
     */
    std::string targetArtifactPath(const ArchiveDescriptor& descriptor, const std::string& targetHome) const;

    /**
     * @brief FTP URL of an artifact, without credentials.
     */
    std::string sourceUrl(const BulkTransferSource& source, const ArchiveDescriptor& descriptor) const;

    /**
     * @brief Builds the pull command; the FTP password is a secret argument.
     */
    ShellCommand buildCommand(const BulkTransferSource& source,
                              const ArchiveDescriptor& descriptor,
                              const std::string& targetStaging) const;

    const RetrieverOptions& options() const { return options_; }

private:
    const TransferLogger& logger_; ///< Shared run logger.
    ProgressObserver* observer_; ///< Optional progress sink.
    RetrieverOptions options_; ///< Polling, timeout and wget settings.
};

#endif // ARTIFACT_RETRIEVER_HPP
