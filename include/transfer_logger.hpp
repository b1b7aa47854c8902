/**
 * @file transfer_logger.hpp
 * @brief Logging and progress rendering seams for SiteRelay.
 *
 * The logger is created by the caller of a transfer and handed by reference to
 * every component, so each run decides where its diagnostics go.
 */

#ifndef TRANSFER_LOGGER_HPP
#define TRANSFER_LOGGER_HPP

#include <mutex>
#include <string>
#include "transfer_types.hpp"

/**
 * @brief Severity of a log entry.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Timestamped file and console logger.
 *
 * Entries look like "[2025-10-02 14:03:11] INFO Archive created". Warnings and
 * errors are echoed to stderr, the rest to stdout.
 */
class TransferLogger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param logFile Log file to append to; empty disables file output.
     * @param level Minimum level that is written.
     * @param console If false, nothing is echoed to stdout/stderr.
     * @note The log file's parent directory is created on first write.
     */
    explicit TransferLogger(std::string logFile = {}, LogLevel level = LogLevel::Info, bool console = true);

    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warning(const std::string& message) const;
    void error(const std::string& message) const;

    /**
     * @brief Changes the minimum level that is written.
     */
    void setLevel(LogLevel level);

    LogLevel level() const { return level_; }

    const std::string& logFile() const { return logFile_; }

    /**
     * @brief Returns the upper-case name of a level, e.g. "WARNING".
     */
    static std::string levelName(LogLevel level);

private:
    void write(LogLevel level, const std::string& message) const;

    std::string logFile_; ///< Append target; empty when file logging is off.
    LogLevel level_; ///< Minimum level written.
    bool console_; ///< Echo entries to the terminal.
    mutable std::mutex mutex_; ///< Serializes writers.
};

/**
 * @brief Receives progress samples of an artifact retrieval.
 */
class ProgressObserver {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ProgressObserver() = default;

    /**
     * @brief Called for every parsed progress line, in arrival order.
     */
    virtual void onProgress(const ProgressSample& sample) = 0;

    /**
     * @brief Called once when the retrieval command has ended.
     */
    virtual void onFinished() {}
};

/**
 * @brief Renders progress on a single, carriage-return refreshed terminal line.
 */
class ConsoleProgressObserver : public ProgressObserver {
public:
    void onProgress(const ProgressSample& sample) override;
    void onFinished() override;

    /**
     * @brief Formats a sample as "Download Progress: 45% (12.3M) @ 892KB/s - eta 15s".
     */
    static std::string formatSample(const ProgressSample& sample);

private:
    bool lineOpen_ = false; ///< A progress line is on screen without a newline.
};

#endif // TRANSFER_LOGGER_HPP
