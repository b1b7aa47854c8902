/**
 * @file transfer_api.hpp
 * @brief High-level API for running SiteRelay transfers.
 *
 * Wraps configuration loading, the orchestrator run and report persistence
 * behind a few calls that never throw, serving as the entry point for the
 * command-line tool and for embedding applications.
 */

#ifndef TRANSFER_API_HPP
#define TRANSFER_API_HPP

#include <expected>
#include <functional>
#include <string>
#include <json/json.h>
#include "remote_session.hpp"
#include "transfer_config.hpp"
#include "transfer_logger.hpp"
#include "transfer_report.hpp"

/**
 * @brief API for running transfers.
 */
class TransferAPI {
public:
    /**
     * @brief Loads a configuration file, applying overrides before validation.
     *
     * Objects in @p overrides are merged key by key into the file's objects;
     * any other value replaces the file's value.
     *
     * @param configFile Path to the JSON configuration file.
     * @param overrides JSON object with values taking precedence, e.g. {"path": "..."}.
     * @return std::expected<TransferConfig, std::string> The configuration or an error message.
     */
    static std::expected<TransferConfig, std::string> loadConfig(const std::string& configFile,
                                                                 const Json::Value& overrides = Json::Value());

    /**
     * @brief Runs one transfer.
     *
     * @param config Validated configuration.
     * @param connector Session factory, e.g. SshSession::connector().
     * @param logger Run logger.
     * @param observer Progress sink; may be nullptr.
     * @param shouldCancel Cooperative cancellation check; may be empty.
     * @return std::expected<TransferReport, std::string> The completed report (which may describe a
     *         failed transfer), or an error message if the transfer could not be started.
     */
    static std::expected<TransferReport, std::string> startTransfer(const TransferConfig& config,
                                                                    SessionConnector connector,
                                                                    const TransferLogger& logger,
                                                                    ProgressObserver* observer = nullptr,
                                                                    std::function<bool()> shouldCancel = {});

    /**
     * @brief Writes the CSV and JSON reports the configuration asks for.
     *
     * @param report Completed report.
     * @param config Names the report files; empty names are skipped.
     * @return std::expected<void, std::string> Success or the joined error messages.
     */
    static std::expected<void, std::string> saveReports(const TransferReport& report, const TransferConfig& config);

    /**
     * @brief Recursively merges @p overrides into @p base.
     */
    static void mergeJson(Json::Value& base, const Json::Value& overrides);
};

#endif // TRANSFER_API_HPP
