#include "recovery_engine.hpp"

RecoveryEngine::RecoveryEngine(const ArchivePacker& packer,
                               const ArtifactRetriever& retriever,
                               const Extractor& extractor,
                               const Verifier& verifier,
                               const TransferLogger& logger)
    : packer_(packer), retriever_(retriever), extractor_(extractor), verifier_(verifier), logger_(logger) {}

std::expected<RecoveryResult, TransferError> RecoveryEngine::recover(RemoteSession& source,
                                                                     RemoteSession& target,
                                                                     const RecoveryContext& context,
                                                                     const MissingFileSet& missing,
                                                                     std::vector<RemoteArtifact>& artifacts) const {
    if (missing.empty()) {
        return std::unexpected(TransferError{TransferErrorKind::RecoveryIncomplete, "No missing files to recover"});
    }
    logger_.info("Recovering " + std::to_string(missing.size()) + " missing files");

    RecoveryResult result;
    result.plan.missingPaths = missing;

    ArchiveDescriptor planned = packer_.planFileList(context.sourceHome, context.sourcePath, "recovery");
    artifacts.push_back({&source, planned.fileListPath});
    artifacts.push_back({&source, planned.remotePath});

    auto packed = packer_.packFileList(source, planned, missing);
    if (!packed) {
        return std::unexpected(packed.error());
    }
    result.plan.archive = *packed;

    artifacts.push_back({&target, retriever_.targetArtifactPath(*packed, context.targetHome)});
    auto retrieved = retriever_.retrieve(target, context.bulkSource, *packed, context.targetHome);
    if (!retrieved) {
        return std::unexpected(retrieved.error());
    }

    auto extracted = extractor_.extract(target, retrieved->artifact, context.targetPath);
    if (!extracted) {
        return std::unexpected(extracted.error());
    }

    auto verified = verifier_.verify(source, target, context.sourcePath, context.targetPath, false);
    if (!verified) {
        return std::unexpected(verified.error());
    }
    result.verification = *verified;
    result.resolved = verified->outcome != VerificationOutcome::Deficit;

    if (result.resolved) {
        logger_.info("All missing files recovered");
    } else {
        logger_.error("Still missing " + std::to_string(result.residual()) + " files after recovery");
    }
    return result;
}
