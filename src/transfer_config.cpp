#include "transfer_config.hpp"
#include <fstream>
#include <stdexcept>

namespace {

HostConfig parseHost(const Json::Value& json, int defaultPort) {
    HostConfig host;
    host.host = json.get("host", "").asString();
    host.port = json.get("port", defaultPort).asInt();
    host.username = json.get("user", "").asString();
    host.password = json.get("password", "").asString();
    return host;
}

} // namespace

TransferConfig::TransferConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + configFile);
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error("Failed to parse config file: " + configFile + ": " + errors);
    }
    *this = fromJson(configJson);
}

TransferConfig TransferConfig::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    TransferConfig config;
    try {
        const Json::Value& source = json["source"];
        if (source.isObject()) {
            config.source = parseHost(source, 22);
            config.ftpPort = source.get("ftp_port", 21).asInt();
            config.ftpPathPrefix = source.get("ftp_path_prefix", "").asString();
        }
        const Json::Value& target = json["target"];
        if (target.isObject()) {
            config.target = parseHost(target, 22);
        }

        config.path = json.get("path", "").asString();
        config.cleanupTempFiles = json.get("cleanup_temp_files", true).asBool();
        config.stagingDir = json.get("staging_dir", "tmp_trans").asString();

        const Json::Value& timeouts = json["timeouts"];
        if (timeouts.isObject()) {
            config.connectTimeout = std::chrono::seconds(timeouts.get("connect", 30).asInt());
            config.probeTimeout = std::chrono::seconds(timeouts.get("probe", 120).asInt());
            config.archiveTimeout = std::chrono::seconds(timeouts.get("archive", 600).asInt());
            config.retrieveTimeout = std::chrono::seconds(timeouts.get("retrieve", 1800).asInt());
        }

        const Json::Value& retrieve = json["retrieve"];
        if (retrieve.isObject()) {
            config.retrieveTries = retrieve.get("tries", 3).asInt();
            config.recoveryTries = retrieve.get("recovery_tries", 2).asInt();
            config.networkTimeout = retrieve.get("network_timeout", 300).asInt();
            config.pollInterval = std::chrono::milliseconds(retrieve.get("poll_interval_ms", 100).asInt());
            config.progressLogInterval = std::chrono::seconds(retrieve.get("progress_log_interval", 5).asInt());
        }

        const Json::Value& connect = json["connect"];
        if (connect.isObject()) {
            config.connectAttempts = connect.get("attempts", 3).asInt();
            config.connectBaseDelay = std::chrono::milliseconds(connect.get("base_delay_ms", 1000).asInt());
        }

        config.logFile = json.get("log_file", "siterelay.log").asString();
        config.verbose = json.get("verbose", false).asBool();

        const Json::Value& report = json["report"];
        if (report.isObject()) {
            config.csvReport = report.get("csv", "transfers_results.csv").asString();
            config.jsonReport = report.get("json", "").asString();
        }
    } catch (const Json::Exception& e) {
        throw std::runtime_error(std::string("Invalid value in config: ") + e.what());
    }

    config.validate();
    return config;
}

void TransferConfig::validate() const {
    auto require = [](bool condition, const std::string& message) {
        if (!condition) {
            throw std::runtime_error(message);
        }
    };

    require(!source.host.empty(), "Missing required config field: source.host");
    require(!source.username.empty(), "Missing required config field: source.user");
    require(!target.host.empty(), "Missing required config field: target.host");
    require(!target.username.empty(), "Missing required config field: target.user");
    require(!path.empty(), "Missing required config field: path");
    require(!stagingDir.empty(), "staging_dir must not be empty");

    require(source.port > 0 && source.port <= 65535, "source.port is out of range");
    require(target.port > 0 && target.port <= 65535, "target.port is out of range");
    require(ftpPort > 0 && ftpPort <= 65535, "source.ftp_port is out of range");

    require(connectTimeout.count() > 0, "timeouts.connect must be positive");
    require(probeTimeout.count() > 0, "timeouts.probe must be positive");
    require(archiveTimeout.count() > 0, "timeouts.archive must be positive");
    require(retrieveTimeout.count() > 0, "timeouts.retrieve must be positive");
    require(retrieveTries > 0, "retrieve.tries must be positive");
    require(recoveryTries > 0, "retrieve.recovery_tries must be positive");
    require(networkTimeout > 0, "retrieve.network_timeout must be positive");
    require(pollInterval.count() > 0, "retrieve.poll_interval_ms must be positive");
    require(connectAttempts > 0, "connect.attempts must be positive");
    require(connectBaseDelay.count() >= 0, "connect.base_delay_ms must not be negative");
}

BulkTransferSource TransferConfig::bulkSource() const {
    BulkTransferSource bulk;
    bulk.host = source.host;
    bulk.port = ftpPort;
    bulk.username = source.username;
    bulk.password = source.password;
    bulk.pathPrefix = ftpPathPrefix;
    return bulk;
}
