#include "transfer_orchestrator.hpp"
#include "shell_command.hpp"
#include <stdexcept>
#include <utility>

namespace {

PackerOptions packerOptions(const TransferConfig& config) {
    PackerOptions options;
    options.stagingDir = config.stagingDir;
    options.archiveTimeout = config.archiveTimeout;
    options.commandTimeout = config.probeTimeout;
    return options;
}

RetrieverOptions retrieverOptions(const TransferConfig& config, int tries) {
    RetrieverOptions options;
    options.stagingDir = config.stagingDir;
    options.pollInterval = config.pollInterval;
    options.logInterval = config.progressLogInterval;
    options.timeout = config.retrieveTimeout;
    options.commandTimeout = config.probeTimeout;
    options.tries = tries;
    options.networkTimeout = config.networkTimeout;
    return options;
}

} // namespace

TransferOrchestrator::TransferOrchestrator(TransferConfig config,
                                           SessionConnector connector,
                                           const TransferLogger& logger,
                                           ProgressObserver* observer)
    : config_(std::move(config)),
      connector_(std::move(connector)),
      logger_(logger),
      observer_(observer),
      prober_(logger_, config_.probeTimeout),
      packer_(logger_, packerOptions(config_)),
      retriever_(logger_, observer_, retrieverOptions(config_, config_.retrieveTries)),
      recoveryRetriever_(logger_, observer_, retrieverOptions(config_, config_.recoveryTries)),
      extractor_(logger_, config_.archiveTimeout, config_.probeTimeout),
      verifier_(prober_, logger_),
      recovery_(packer_, recoveryRetriever_, extractor_, verifier_, logger_) {
    config_.validate();
    if (!connector_) {
        throw std::runtime_error("No session connector provided");
    }
}

void TransferOrchestrator::onStateChange(StateCallback callback) {
    stateCallback_ = std::move(callback);
}

void TransferOrchestrator::setCancelPredicate(CancelPredicate shouldCancel) {
    shouldCancel_ = std::move(shouldCancel);
}

void TransferOrchestrator::enter(TransferState next) {
    state_ = next;
    history_.push_back(next);
    logger_.debug("State: " + toString(next));
    if (stateCallback_) {
        stateCallback_(next);
    }
}

std::expected<void, TransferError> TransferOrchestrator::advance(TransferState next) {
    if (shouldCancel_ && shouldCancel_()) {
        return std::unexpected(TransferError{TransferErrorKind::Cancelled, "Transfer cancelled by user"});
    }
    enter(next);
    return {};
}

TransferReport TransferOrchestrator::run() {
    history_.clear();
    enter(TransferState::Init);

    TransferReport report("SSH", config_.path, config_.path);
    logger_.info("--- Transfer start: " + config_.path + " (" + config_.source.host + " -> " + config_.target.host +
                 ") ---");

    RunContext context;
    auto outcome = execute(context, report);
    if (!outcome) {
        logger_.error(outcome.error().describe());
        report.addError(outcome.error().describe());
    }

    enter(TransferState::CleaningUp);
    cleanUp(context, report);
    closeSessions(context);

    if (context.lastVerification) {
        report.setCounts(context.lastVerification->targetFileCount, context.lastVerification->targetDirCount);
    }

    const bool success = report.errors().empty();
    if (success) {
        report.setTransferredSize(report.totalSizeBytes());
    }
    const TransferState finalState = success ? TransferState::Completed : TransferState::Failed;
    enter(finalState);
    report.setFinalState(finalState);
    report.complete(success);

    if (success) {
        logger_.info("Transfer completed in " + formatDecimal(report.durationSeconds()) + " seconds, average speed " +
                     formatDecimal(report.averageSpeedMBps()) + " MB/s");
    } else {
        logger_.error("Transfer failed: " + report.joinedErrors());
    }
    logger_.info("--- Transfer complete: " + config_.path + " ---");
    return report;
}

std::expected<void, TransferError> TransferOrchestrator::execute(RunContext& context, TransferReport& report) {
    if (auto step = advance(TransferState::Connecting); !step) {
        return step;
    }
    ConnectPolicy policy;
    policy.maxAttempts = config_.connectAttempts;
    policy.baseDelay = config_.connectBaseDelay;

    auto source = connectWithBackoff(connector_, config_.source, policy, logger_);
    if (!source) {
        return std::unexpected(source.error());
    }
    context.source = std::move(*source);

    auto target = connectWithBackoff(connector_, config_.target, policy, logger_);
    if (!target) {
        return std::unexpected(target.error());
    }
    context.target = std::move(*target);

    auto sourceHome = resolveHome(*context.source);
    if (!sourceHome) {
        return std::unexpected(sourceHome.error());
    }
    auto targetHome = resolveHome(*context.target);
    if (!targetHome) {
        return std::unexpected(targetHome.error());
    }
    context.sourceHome = *sourceHome;
    context.targetHome = *targetHome;
    context.sourcePath = resolveRemotePath(context.sourceHome, config_.path);
    context.targetPath = resolveRemotePath(context.targetHome, config_.path);
    report.setSourcePath(context.sourcePath);
    report.setTargetPath(context.targetPath);

    if (auto step = advance(TransferState::Probing); !step) {
        return step;
    }
    ProbeOutcome probe = prober_.probe(*context.source, context.sourcePath);
    for (const auto& degraded : probe.degraded) {
        report.addWarning(degraded.describe());
    }
    report.setTotalSize(probe.snapshot.totalSizeBytes);
    report.setSourceCounts(probe.snapshot.fileCount, probe.snapshot.dirCount);
    if (probe.degraded.empty() && probe.snapshot.fileCount == 0) {
        logger_.warning("Source directory appears to be empty");
        report.addWarning("Source directory appears to be empty");
    }

    if (auto step = advance(TransferState::Archiving); !step) {
        return step;
    }
    auto planned = packer_.plan(context.sourceHome, config_.path);
    if (!planned) {
        return std::unexpected(planned.error());
    }
    context.artifacts.push_back({context.source.get(), planned->remotePath});
    auto archive = packer_.pack(*context.source, *planned);
    if (!archive) {
        return std::unexpected(archive.error());
    }

    if (auto step = advance(TransferState::Retrieving); !step) {
        return step;
    }
    context.artifacts.push_back({context.target.get(), retriever_.targetArtifactPath(*archive, context.targetHome)});
    auto retrieved = retriever_.retrieve(*context.target, config_.bulkSource(), *archive, context.targetHome);
    if (!retrieved) {
        return std::unexpected(retrieved.error());
    }

    if (auto step = advance(TransferState::Extracting); !step) {
        return step;
    }
    std::string destination = splitRemotePath(context.targetPath).first;
    if (destination.empty()) {
        destination = context.targetHome;
    }
    auto extracted = extractor_.extract(*context.target, retrieved->artifact, destination);
    if (!extracted) {
        return std::unexpected(extracted.error());
    }

    if (auto step = advance(TransferState::Verifying); !step) {
        return step;
    }
    auto verified = verifier_.verify(*context.source, *context.target, context.sourcePath, context.targetPath);
    if (!verified) {
        return std::unexpected(verified.error());
    }
    context.lastVerification = *verified;

    return reconcile(context, report, *verified);
}

std::expected<void, TransferError> TransferOrchestrator::reconcile(RunContext& context,
                                                                   TransferReport& report,
                                                                   const VerificationResult& verification) {
    switch (verification.outcome) {
        case VerificationOutcome::Match:
            return {};
        case VerificationOutcome::Surplus:
            report.addWarning("Target has " +
                              std::to_string(verification.targetFileCount - verification.sourceFileCount) +
                              " extra files");
            return {};
        case VerificationOutcome::Deficit:
            break;
    }

    const std::uint64_t deficit = verification.deficit();
    if (verification.missing.empty()) {
        return std::unexpected(TransferError{TransferErrorKind::VerificationDeficit,
                                             "Target lacks " + std::to_string(deficit) +
                                                 " files but no missing path could be identified"});
    }

    if (auto step = advance(TransferState::Recovering); !step) {
        return step;
    }
    RecoveryContext recoveryContext;
    recoveryContext.sourceHome = context.sourceHome;
    recoveryContext.targetHome = context.targetHome;
    recoveryContext.sourcePath = context.sourcePath;
    recoveryContext.targetPath = context.targetPath;
    recoveryContext.bulkSource = config_.bulkSource();

    auto recovered = recovery_.recover(*context.source, *context.target, recoveryContext, verification.missing,
                                       context.artifacts);
    if (!recovered) {
        logger_.error(recovered.error().describe());
        report.addError(recovered.error().describe());
        return std::unexpected(TransferError{TransferErrorKind::RecoveryIncomplete,
                                             "Recovery failed, " + std::to_string(deficit) +
                                                 " files still missing"});
    }

    context.lastVerification = recovered->verification;
    if (!recovered->resolved) {
        return std::unexpected(TransferError{TransferErrorKind::RecoveryIncomplete,
                                             std::to_string(recovered->residual()) +
                                                 " files still missing after recovery"});
    }
    return {};
}

std::expected<std::string, TransferError> TransferOrchestrator::resolveHome(RemoteSession& session) const {
    auto result = session.execute("pwd", config_.probeTimeout);
    std::string home;
    if (result && result->succeeded()) {
        home = result->out;
        while (!home.empty() && (home.back() == '\n' || home.back() == '\r' || home.back() == ' ')) {
            home.pop_back();
        }
    }
    if (home.empty() || home.front() != '/') {
        std::string reason = !result ? result.error()
                                     : (!result->succeeded() ? "exit code " + std::to_string(result->exitCode)
                                                             : "unexpected output '" + result->out + "'");
        return std::unexpected(TransferError{TransferErrorKind::ConnectionError,
                                             "Could not determine home directory on " + session.host() + ": " +
                                                 reason});
    }
    logger_.debug("Home directory on " + session.host() + ": " + home);
    return home;
}

void TransferOrchestrator::cleanUp(RunContext& context, TransferReport& report) const {
    if (context.artifacts.empty()) {
        return;
    }
    if (!config_.cleanupTempFiles) {
        for (const auto& artifact : context.artifacts) {
            logger_.info("Keeping temporary file " +
                         (artifact.session ? artifact.session->host() + ":" : std::string()) + artifact.path);
        }
        return;
    }

    logger_.info("Cleaning up temporary files");
    for (const auto& artifact : context.artifacts) {
        if (!artifact.session || !artifact.session->isConnected()) {
            TransferError warning{TransferErrorKind::CleanupWarning,
                                  "Cannot remove " + artifact.path + ": session is closed"};
            logger_.warning(warning.describe());
            report.addWarning(warning.describe());
            continue;
        }

        ShellCommand rm("rm");
        rm.arg("--").arg(artifact.path);
        auto result = artifact.session->execute(rm.str(), config_.probeTimeout);
        if (result && result->succeeded()) {
            logger_.info("Removed " + artifact.session->host() + ":" + artifact.path);
            continue;
        }

        std::string reason;
        if (!result) {
            reason = result.error();
        } else {
            reason = "exit code " + std::to_string(result->exitCode);
            std::string detail = result->err;
            while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
                detail.pop_back();
            }
            if (!detail.empty()) {
                reason += ": " + detail;
            }
        }
        TransferError warning{TransferErrorKind::CleanupWarning,
                              "Failed to remove " + artifact.session->host() + ":" + artifact.path + " (" + reason +
                                  ")"};
        logger_.warning(warning.describe());
        report.addWarning(warning.describe());
    }
}

void TransferOrchestrator::closeSessions(RunContext& context) {
    if (context.target) {
        context.target->close();
    }
    if (context.source) {
        context.source->close();
    }
}
