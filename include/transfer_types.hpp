/**
 * @file transfer_types.hpp
 * @brief Value types shared by the SiteRelay transfer pipeline.
 *
 * Holds the plain data records exchanged between the prober, packer, retriever,
 * extractor, verifier and recovery engine, together with the error kinds every
 * component reports through std::expected.
 */

#ifndef TRANSFER_TYPES_HPP
#define TRANSFER_TYPES_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Connection identity of one host.
 */
struct HostConfig {
    std::string host; ///< Hostname or IP address.
    int port = 22; ///< SSH port.
    std::string username; ///< Login user.
    std::string password; ///< Password; empty means public key authentication.
};

/**
 * @brief Coordinates the target host uses to pull artifacts from the source.
 *
 * The bulk channel is FTP served by the source host with the source credentials.
 */
struct BulkTransferSource {
    std::string host; ///< Source hostname as reachable from the target.
    int port = 21; ///< FTP port on the source.
    std::string username; ///< FTP user.
    std::string password; ///< FTP password.
    std::string pathPrefix; ///< Prefix between the FTP root and the staging directory.
};

/**
 * @brief Outcome of one remote shell command.
 */
struct CommandResult {
    int exitCode = -1; ///< Remote exit status.
    std::string out; ///< Captured stdout.
    std::string err; ///< Captured stderr.

    bool succeeded() const { return exitCode == 0; }
};

/**
 * @brief Advisory measurement of a directory at one point in time.
 */
struct DirectorySnapshot {
    std::uint64_t totalSizeBytes = 0; ///< Summed disk usage in bytes.
    std::uint64_t fileCount = 0; ///< Regular files below the path.
    std::uint64_t dirCount = 0; ///< Directories below the path, root included.
};

/**
 * @brief A compressed artifact that lives on one host's filesystem.
 */
struct ArchiveDescriptor {
    std::string remotePath; ///< Absolute path of the artifact on the source host.
    std::string fileName; ///< Shell-safe artifact file name.
    std::string sourceBasePath; ///< Directory tar was run from.
    std::string containedRelativeRoot; ///< Top-level entry inside the archive; empty for file-list archives.
    std::optional<std::uint64_t> byteSize; ///< Artifact size when it could be measured.
    std::string fileListPath; ///< Member list written for file-list archives; empty otherwise.
};

/**
 * @brief One parsed status line of the retrieval tool.
 */
struct ProgressSample {
    double fractionComplete = 0.0; ///< 0.0 .. 1.0.
    std::uint64_t bytesTransferred = 0; ///< Bytes received so far.
    double rateBytesPerSec = 0.0; ///< Current transfer rate.
    std::optional<std::uint64_t> etaSeconds; ///< Remaining time when reported.
    std::string sizeToken; ///< Raw size token, e.g. "12.3M".
    std::string rateToken; ///< Raw rate token, e.g. "892KB/s".
    std::optional<std::string> etaToken; ///< Raw ETA token without the "eta" keyword, e.g. "15s".
};

/// Relative paths present on the source but absent on the target.
using MissingFileSet = std::set<std::string>;

/**
 * @brief Second, minimal archive holding exactly the missing paths.
 */
struct RecoveryPlan {
    ArchiveDescriptor archive; ///< Recovery artifact on the source host.
    MissingFileSet missingPaths; ///< Paths the artifact was built from.
};

/**
 * @brief Kinds of failure the pipeline distinguishes.
 */
enum class TransferErrorKind {
    ConnectionError,
    ProbeDegraded,
    PackError,
    RetrievalError,
    ExtractError,
    VerificationDeficit,
    RecoveryIncomplete,
    CleanupWarning,
    Cancelled
};

/**
 * @brief Error value returned by pipeline components.
 */
struct TransferError {
    TransferErrorKind kind; ///< Failure category.
    std::string message; ///< Human readable explanation.

    /**
     * @brief Renders the error as "<Kind>: <message>".
     */
    std::string describe() const;
};

/**
 * @brief Returns the display name of an error kind, e.g. "PackError".
 */
std::string toString(TransferErrorKind kind);

/**
 * @brief States of one transfer run, in pipeline order.
 */
enum class TransferState {
    Init,
    Connecting,
    Probing,
    Archiving,
    Retrieving,
    Extracting,
    Verifying,
    Recovering,
    CleaningUp,
    Completed,
    Failed
};

/**
 * @brief Returns the display name of a state, e.g. "Retrieving".
 */
std::string toString(TransferState state);

#endif // TRANSFER_TYPES_HPP
