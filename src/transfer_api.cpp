#include "transfer_api.hpp"
#include "report_writer.hpp"
#include "transfer_orchestrator.hpp"
#include <fstream>
#include <utility>

void TransferAPI::mergeJson(Json::Value& base, const Json::Value& overrides) {
    if (!overrides.isObject()) {
        return;
    }
    for (const auto& key : overrides.getMemberNames()) {
        const Json::Value& value = overrides[key];
        if (value.isObject() && base[key].isObject()) {
            mergeJson(base[key], value);
        } else {
            base[key] = value;
        }
    }
}

std::expected<TransferConfig, std::string> TransferAPI::loadConfig(const std::string& configFile,
                                                                   const Json::Value& overrides) {
    try {
        std::ifstream file(configFile);
        if (!file.is_open()) {
            return std::unexpected("Failed to open config file: " + configFile);
        }
        Json::Value configJson;
        Json::CharReaderBuilder builder;
        std::string errors;
        if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
            return std::unexpected("Failed to parse config file: " + configFile + ": " + errors);
        }
        mergeJson(configJson, overrides);
        return TransferConfig::fromJson(configJson);
    } catch (const std::exception& e) {
        return std::unexpected("Failed to load config: " + std::string(e.what()));
    }
}

std::expected<TransferReport, std::string> TransferAPI::startTransfer(const TransferConfig& config,
                                                                      SessionConnector connector,
                                                                      const TransferLogger& logger,
                                                                      ProgressObserver* observer,
                                                                      std::function<bool()> shouldCancel) {
    try {
        TransferOrchestrator orchestrator(config, std::move(connector), logger, observer);
        if (shouldCancel) {
            orchestrator.setCancelPredicate(std::move(shouldCancel));
        }
        return orchestrator.run();
    } catch (const std::exception& e) {
        return std::unexpected("Failed to start transfer: " + std::string(e.what()));
    }
}

std::expected<void, std::string> TransferAPI::saveReports(const TransferReport& report, const TransferConfig& config) {
    std::string errors;
    if (!config.csvReport.empty()) {
        auto csv = ReportWriter::appendCsv(report, config.csvReport);
        if (!csv) {
            errors = csv.error();
        }
    }
    if (!config.jsonReport.empty()) {
        auto json = ReportWriter::writeJson(report, config.jsonReport);
        if (!json) {
            errors += (errors.empty() ? "" : "; ") + json.error();
        }
    }
    if (!errors.empty()) {
        return std::unexpected(errors);
    }
    return {};
}
