/**
 * @file transfer_orchestrator.hpp
 * @brief State machine that runs one SiteRelay transfer end to end.
 *
 * Sequences Connecting, Probing, Archiving, Retrieving, Extracting, Verifying
 * and, on a deficit, one Recovering pass. CleaningUp always runs, and the run
 * ends in Completed or Failed with a sealed TransferReport.
 *
 * @note Failures never escape run(); they are recorded in the report's error list.
 */

#ifndef TRANSFER_ORCHESTRATOR_HPP
#define TRANSFER_ORCHESTRATOR_HPP

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "archive_packer.hpp"
#include "artifact_retriever.hpp"
#include "directory_prober.hpp"
#include "extractor.hpp"
#include "recovery_engine.hpp"
#include "remote_session.hpp"
#include "transfer_config.hpp"
#include "transfer_logger.hpp"
#include "transfer_report.hpp"
#include "transfer_types.hpp"
#include "verifier.hpp"

/**
 * @brief Runs the transfer-and-reconcile pipeline for one path.
 */
class TransferOrchestrator {
public:
    /// Notified on every state the run enters.
    using StateCallback = std::function<void(TransferState)>;

    /// Polled before every step; returning true cancels the run.
    using CancelPredicate = std::function<bool()>;

    /**
     * @brief Constructs an orchestrator.
     *
     * @param config Hosts, path, timeouts and cleanup settings.
     * @param connector Opens one session attempt; used for both hosts.
     * @param logger Run logger; must outlive the orchestrator.
     * @param observer Progress sink for downloads; may be nullptr.
     * @throws std::runtime_error If @p config fails validation.
     */
    TransferOrchestrator(TransferConfig config,
                         SessionConnector connector,
                         const TransferLogger& logger,
                         ProgressObserver* observer = nullptr);

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    /**
     * @brief Registers a callback for state changes.
     */
    void onStateChange(StateCallback callback);

    /**
     * @brief Registers the cooperative cancellation check.
     *
     * Once it returns true no new step is started; commands already running on
     * a host run to their own completion or timeout. Cleanup still runs.
     */
    void setCancelPredicate(CancelPredicate shouldCancel);

    /**
     * @brief Executes the transfer.
     *
     * @return TransferReport The completed report; success is true only if no error was recorded.
     */
    TransferReport run();

    TransferState state() const { return state_; }

    /**
     * @brief States entered by the last run, in order, starting with Init.
     */
    const std::vector<TransferState>& stateHistory() const { return history_; }

    const TransferConfig& config() const { return config_; }

private:
    /// Resources and intermediate results of one run.
    struct RunContext {
        std::unique_ptr<RemoteSession> source;
        std::unique_ptr<RemoteSession> target;
        std::string sourceHome;
        std::string targetHome;
        std::string sourcePath;
        std::string targetPath;
        std::vector<RemoteArtifact> artifacts;
        std::optional<VerificationResult> lastVerification;
    };

    std::expected<void, TransferError> execute(RunContext& context, TransferReport& report);

    std::expected<void, TransferError> reconcile(RunContext& context,
                                                 TransferReport& report,
                                                 const VerificationResult& verification);

    std::expected<void, TransferError> advance(TransferState next);

    std::expected<std::string, TransferError> resolveHome(RemoteSession& session) const;

    void enter(TransferState next);

    void cleanUp(RunContext& context, TransferReport& report) const;

    static void closeSessions(RunContext& context);

    TransferConfig config_; ///< Run settings.
    SessionConnector connector_; ///< Session factory.
    const TransferLogger& logger_; ///< Shared run logger.
    ProgressObserver* observer_; ///< Optional progress sink.
    DirectoryProber prober_; ///< Probe and counting commands.
    ArchivePacker packer_; ///< Source archives.
    ArtifactRetriever retriever_; ///< Primary download.
    ArtifactRetriever recoveryRetriever_; ///< Recovery download, fewer tries.
    Extractor extractor_; ///< Target extraction.
    Verifier verifier_; ///< Post-transfer counting.
    RecoveryEngine recovery_; ///< Single recovery pass.
    StateCallback stateCallback_; ///< Optional state listener.
    CancelPredicate shouldCancel_; ///< Optional cancellation check.
    TransferState state_ = TransferState::Init; ///< Current state.
    std::vector<TransferState> history_; ///< States of the last run.
};

#endif // TRANSFER_ORCHESTRATOR_HPP
