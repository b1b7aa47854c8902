/**
 * @file transfer_report.hpp
 * @brief Outcome record of one transfer run.
 *
 * The report is filled in while the run progresses and sealed exactly once by
 * complete(). Every mutator throws std::logic_error once the report is sealed.
 */

#ifndef TRANSFER_REPORT_HPP
#define TRANSFER_REPORT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "transfer_types.hpp"

/**
 * @brief Accumulated data of a transfer run.
 */
class TransferReport {
public:
    using Clock = std::chrono::system_clock;

    /**
     * @brief Starts a report; the start time is taken now.
     *
     * @param protocol Transport description stored with the report, e.g. "SSH".
     * @param sourcePath Source directory as requested.
     * @param targetPath Target directory as requested.
     */
    TransferReport(std::string protocol, std::string sourcePath, std::string targetPath);

    void setSourcePath(const std::string& path);
    void setTargetPath(const std::string& path);
    void setTotalSize(std::uint64_t bytes);
    void setTransferredSize(std::uint64_t bytes);

    /**
     * @brief Records the target-side counts of the last verification pass.
     */
    void setCounts(std::uint64_t files, std::uint64_t directories);

    /**
     * @brief Records the source-side counts of the initial probe.
     */
    void setSourceCounts(std::uint64_t files, std::uint64_t directories);

    /**
     * @brief Appends an error; any error makes the run a failure.
     */
    void addError(const std::string& message);

    /**
     * @brief Appends a warning; warnings never affect success.
     */
    void addWarning(const std::string& message);

    void setFinalState(TransferState state);

    /**
     * @brief Seals the report and takes the end time.
     *
     * @param success Outcome of the run.
     * @throws std::logic_error If the report was already completed.
     */
    void complete(bool success);

    bool isComplete() const { return endTime_.has_value(); }
    bool success() const { return success_; }
    const std::string& protocol() const { return protocol_; }
    const std::string& sourcePath() const { return sourcePath_; }
    const std::string& targetPath() const { return targetPath_; }
    std::uint64_t totalSizeBytes() const { return totalSizeBytes_; }
    std::uint64_t transferredSizeBytes() const { return transferredSizeBytes_; }
    std::uint64_t fileCount() const { return fileCount_; }
    std::uint64_t directoryCount() const { return directoryCount_; }
    std::uint64_t sourceFileCount() const { return sourceFileCount_; }
    std::uint64_t sourceDirectoryCount() const { return sourceDirectoryCount_; }
    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }
    TransferState finalState() const { return finalState_; }
    Clock::time_point startTime() const { return startTime_; }
    std::optional<Clock::time_point> endTime() const { return endTime_; }

    /**
     * @brief Seconds from start to end, or to now while the run is still going.
     */
    double durationSeconds() const;

    /**
     * @brief Average speed in MiB per second over the whole run; 0 for a zero duration.
     */
    double averageSpeedMBps() const;

    /**
     * @brief Errors joined with "; ".
     */
    std::string joinedErrors() const;

private:
    void requireOpen() const;

    std::string protocol_; ///< Transport description.
    std::string sourcePath_; ///< Source directory.
    std::string targetPath_; ///< Target directory.
    std::uint64_t totalSizeBytes_ = 0; ///< Size reported by the source probe.
    std::uint64_t transferredSizeBytes_ = 0; ///< Bytes delivered; equals total size on success.
    std::uint64_t fileCount_ = 0; ///< Target files after the last verification.
    std::uint64_t directoryCount_ = 0; ///< Target directories after the last verification.
    std::uint64_t sourceFileCount_ = 0; ///< Source files from the probe.
    std::uint64_t sourceDirectoryCount_ = 0; ///< Source directories from the probe.
    std::vector<std::string> errors_; ///< "<Kind>: <message>" entries.
    std::vector<std::string> warnings_; ///< Non-fatal findings.
    TransferState finalState_ = TransferState::Init; ///< Last state of the run.
    bool success_ = false; ///< Outcome, valid once complete.
    Clock::time_point startTime_; ///< Run start.
    std::optional<Clock::time_point> endTime_; ///< Set by complete().
};

/**
 * @brief Formats a number with a fixed count of decimals, e.g. 12.5 -> "12.50".
 *
 * Used for durations, sizes and speeds in logs, summaries and CSV rows.
 */
std::string formatDecimal(double value, int precision = 2);

#endif // TRANSFER_REPORT_HPP
