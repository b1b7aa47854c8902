/**
 * @file verifier.hpp
 * @brief Post-transfer verification by counting.
 *
 * Re-measures both copies of the transferred directory, independent of the
 * initial probe, and on a deficit computes exactly which relative file paths
 * are missing on the target.
 */

#ifndef VERIFIER_HPP
#define VERIFIER_HPP

#include <cstdint>
#include <expected>
#include <string>
#include "directory_prober.hpp"
#include "remote_session.hpp"
#include "transfer_logger.hpp"
#include "transfer_types.hpp"

/**
 * @brief How the target file count compares with the source.
 */
enum class VerificationOutcome {
    Match,   ///< Equal file counts.
    Deficit, ///< Target has fewer files; recovery is needed.
    Surplus  ///< Target has more files; logged as a warning only.
};

/**
 * @brief Returns "Match", "Deficit" or "Surplus".
 */
std::string toString(VerificationOutcome outcome);

/**
 * @brief Counts of both sides after one verification pass.
 */
struct VerificationResult {
    std::uint64_t sourceFileCount = 0; ///< Regular files on the source.
    std::uint64_t targetFileCount = 0; ///< Regular files on the target.
    std::uint64_t sourceDirCount = 0; ///< Directories below the source root, root excluded.
    std::uint64_t targetDirCount = 0; ///< Directories below the target root, root excluded.
    VerificationOutcome outcome = VerificationOutcome::Match; ///< Comparison of the file counts.
    MissingFileSet missing; ///< Relative paths missing on the target; filled on a listed deficit.

    /**
     * @brief Files the target lacks by count; 0 unless the outcome is Deficit.
     */
    std::uint64_t deficit() const;
};

/**
 * @brief Compares the source and target copies of a directory.
 */
class Verifier {
public:
    /**
     * @brief Constructs a verifier.
     *
     * @param prober Counting commands; its timeout applies to the listing commands too.
     * @param logger Run logger.
     */
    Verifier(const DirectoryProber& prober, const TransferLogger& logger);

    /**
     * @brief Measures both sides and classifies the result.
     *
     * Counting failures are fatal here because verification is authoritative.
     * On a deficit with @p listMissing set, both sides are listed with
     * `find -type f -printf '%P\0'` and the set difference becomes
     * VerificationResult::missing; failing to list either side is fatal.
     *
     * @param source Source session.
     * @param target Target session.
     * @param sourcePath Absolute directory on the source.
     * @param targetPath Absolute directory on the target.
     * @param listMissing Compute the missing set on a deficit.
     * @return std::expected<VerificationResult, TransferError> Counts and outcome, or a VerificationDeficit error.
     */
    std::expected<VerificationResult, TransferError> verify(RemoteSession& source,
                                                            RemoteSession& target,
                                                            const std::string& sourcePath,
                                                            const std::string& targetPath,
                                                            bool listMissing = true) const;

    /**
     * @brief Relative paths of all regular files below a directory.
     */
    std::expected<MissingFileSet, std::string> listFiles(RemoteSession& session, const std::string& path) const;

    /**
     * @brief Splits NUL-separated output into a set, skipping empty entries.
     */
    static MissingFileSet parseNulSeparated(const std::string& output);

private:
    const DirectoryProber& prober_; ///< Counting commands.
    const TransferLogger& logger_; ///< Shared run logger.
};

#endif // VERIFIER_HPP
