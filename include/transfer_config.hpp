/**
 * @file transfer_config.hpp
 * @brief Configuration of a SiteRelay transfer.
 *
 * Settings are loaded from a JSON file with jsoncpp. Missing optional keys take
 * their defaults; missing required keys and malformed values are reported by
 * throwing std::runtime_error.
 *
 * Example:
 * @code{.json}
 * {
 *   "source": {"host": "old.example.com", "user": "site", "password": "secret"},
 *   "target": {"host": "new.example.com", "user": "site"},
 *   "path": "public_html/blog",
 *   "timeouts": {"retrieve": 3600}
 * }
 * @endcode
 */

#ifndef TRANSFER_CONFIG_HPP
#define TRANSFER_CONFIG_HPP

#include <chrono>
#include <string>
#include <json/json.h>
#include "transfer_types.hpp"

/**
 * @brief Settings of one transfer run.
 */
class TransferConfig {
public:
    /**
     * @brief Constructs a configuration with defaults and no hosts or path.
     */
    TransferConfig() = default;

    /**
     * @brief Loads a configuration from a JSON file.
     *
     * @param configFile Path to the JSON file.
     * @throws std::runtime_error If the file cannot be read or parsed, or a required field is missing.
     */
    explicit TransferConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed JSON document.
     *
     * @param json Root object.
     * @return TransferConfig The validated configuration.
     * @throws std::runtime_error If a required field is missing or a value has the wrong type or range.
     */
    static TransferConfig fromJson(const Json::Value& json);

    /**
     * @brief Checks required fields and value ranges.
     *
     * @throws std::runtime_error Naming the first offending field.
     */
    void validate() const;

    /**
     * @brief FTP coordinates the target uses to pull from the source.
     */
    BulkTransferSource bulkSource() const;

    HostConfig source;                              ///< Source SSH host.
    HostConfig target;                              ///< Target SSH host.
    int ftpPort = 21;                               ///< FTP port of the source host.
    std::string ftpPathPrefix;                      ///< Path between the FTP root and the source home directory.
    std::string path;                               ///< Directory to transfer, relative to home unless absolute.
    bool cleanupTempFiles = true;                   ///< Remove staging artifacts after the run.
    std::string stagingDir = "tmp_trans";           ///< Staging directory on both hosts.
    std::chrono::seconds connectTimeout{30};        ///< SSH connect timeout.
    std::chrono::seconds probeTimeout{120};         ///< Counting, listing and small command timeout.
    std::chrono::seconds archiveTimeout{600};       ///< tar create/extract timeout.
    std::chrono::seconds retrieveTimeout{1800};     ///< Whole download timeout.
    int retrieveTries = 3;                          ///< wget --tries of the primary download.
    int recoveryTries = 2;                          ///< wget --tries of the recovery download.
    int networkTimeout = 300;                       ///< wget --timeout in seconds.
    int connectAttempts = 3;                        ///< SSH connection attempts per host.
    std::chrono::milliseconds connectBaseDelay{1000}; ///< Delay after the first failed attempt; doubles.
    std::chrono::milliseconds pollInterval{100};    ///< Download output poll interval.
    std::chrono::seconds progressLogInterval{5};    ///< Minimum spacing of progress log entries.
    std::string logFile = "siterelay.log";          ///< Log file; empty disables file logging.
    bool verbose = false;                           ///< Log debug entries.
    std::string csvReport = "transfers_results.csv"; ///< CSV report to append to; empty disables it.
    std::string jsonReport;                         ///< JSON report to write; empty disables it.
};

#endif // TRANSFER_CONFIG_HPP
