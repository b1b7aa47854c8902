#include "transfer_report.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

TransferReport::TransferReport(std::string protocol, std::string sourcePath, std::string targetPath)
    : protocol_(std::move(protocol)),
      sourcePath_(std::move(sourcePath)),
      targetPath_(std::move(targetPath)),
      startTime_(Clock::now()) {}

void TransferReport::requireOpen() const {
    if (endTime_) {
        throw std::logic_error("Transfer report is already complete");
    }
}

void TransferReport::setSourcePath(const std::string& path) {
    requireOpen();
    sourcePath_ = path;
}

void TransferReport::setTargetPath(const std::string& path) {
    requireOpen();
    targetPath_ = path;
}

void TransferReport::setTotalSize(std::uint64_t bytes) {
    requireOpen();
    totalSizeBytes_ = bytes;
}

void TransferReport::setTransferredSize(std::uint64_t bytes) {
    requireOpen();
    transferredSizeBytes_ = bytes;
}

void TransferReport::setCounts(std::uint64_t files, std::uint64_t directories) {
    requireOpen();
    fileCount_ = files;
    directoryCount_ = directories;
}

void TransferReport::setSourceCounts(std::uint64_t files, std::uint64_t directories) {
    requireOpen();
    sourceFileCount_ = files;
    sourceDirectoryCount_ = directories;
}

void TransferReport::addError(const std::string& message) {
    requireOpen();
    errors_.push_back(message);
}

void TransferReport::addWarning(const std::string& message) {
    requireOpen();
    warnings_.push_back(message);
}

void TransferReport::setFinalState(TransferState state) {
    requireOpen();
    finalState_ = state;
}

void TransferReport::complete(bool success) {
    requireOpen();
    success_ = success;
    endTime_ = Clock::now();
}

double TransferReport::durationSeconds() const {
    auto end = endTime_.value_or(Clock::now());
    return std::chrono::duration<double>(end - startTime_).count();
}

double TransferReport::averageSpeedMBps() const {
    double duration = durationSeconds();
    if (duration <= 0.0) {
        return 0.0;
    }
    return (static_cast<double>(transferredSizeBytes_) / (1024.0 * 1024.0)) / duration;
}

std::string TransferReport::joinedErrors() const {
    std::string joined;
    for (const auto& error : errors_) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

std::string formatDecimal(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}
