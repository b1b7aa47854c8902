/**
 * @file recovery_engine.hpp
 * @brief Single-pass recovery of files missing after the primary transfer.
 *
 * Builds a second archive holding exactly the missing paths, moves it with the
 * same retriever and extractor as the primary transfer and verifies once more.
 * There is no recovery of the recovery: whatever is still missing afterwards
 * is reported, not retried.
 */

#ifndef RECOVERY_ENGINE_HPP
#define RECOVERY_ENGINE_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <vector>
#include "archive_packer.hpp"
#include "artifact_retriever.hpp"
#include "extractor.hpp"
#include "remote_session.hpp"
#include "transfer_logger.hpp"
#include "transfer_types.hpp"
#include "verifier.hpp"

/**
 * @brief Locations a recovery pass works on.
 */
struct RecoveryContext {
    std::string sourceHome; ///< Home directory on the source.
    std::string targetHome; ///< Home directory on the target.
    std::string sourcePath; ///< Absolute transferred directory on the source.
    std::string targetPath; ///< Absolute copy of that directory on the target.
    BulkTransferSource bulkSource; ///< FTP coordinates of the source.
};

/**
 * @brief Outcome of a completed recovery pass.
 */
struct RecoveryResult {
    RecoveryPlan plan; ///< Archive and paths that were re-sent.
    VerificationResult verification; ///< Counts after the pass.
    bool resolved = false; ///< True when the target no longer lacks files.

    /**
     * @brief Files still missing after the pass.
     */
    std::uint64_t residual() const { return verification.deficit(); }
};

/**
 * @brief Re-sends the files a verification found missing, once.
 */
class RecoveryEngine {
public:
    /**
     * @brief Constructs a recovery engine from the pipeline components.
     *
     * All components are borrowed and must outlive the engine.
     */
    RecoveryEngine(const ArchivePacker& packer,
                   const ArtifactRetriever& retriever,
                   const Extractor& extractor,
                   const Verifier& verifier,
                   const TransferLogger& logger);

    /**
     * @brief Runs the recovery pass.
     *
     * Every artifact the pass creates (source list file and archive, target
     * archive) is appended to @p artifacts before the step that creates it, so
     * cleanup removes it even when a later step fails.
     *
     * @param source Source session.
     * @param target Target session.
     * @param context Homes, paths and FTP coordinates.
     * @param missing Relative paths to re-send; must not be empty.
     * @param artifacts Cleanup registry of the run.
     * @return std::expected<RecoveryResult, TransferError> The pass outcome, or the error of the step that failed.
     */
    std::expected<RecoveryResult, TransferError> recover(RemoteSession& source,
                                                         RemoteSession& target,
                                                         const RecoveryContext& context,
                                                         const MissingFileSet& missing,
                                                         std::vector<RemoteArtifact>& artifacts) const;

private:
    const ArchivePacker& packer_; ///< Builds the file-list archive.
    const ArtifactRetriever& retriever_; ///< Moves it to the target.
    const Extractor& extractor_; ///< Unpacks it into the target copy.
    const Verifier& verifier_; ///< Re-counts both sides.
    const TransferLogger& logger_; ///< Shared run logger.
};

#endif // RECOVERY_ENGINE_HPP
