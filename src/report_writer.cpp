#include "report_writer.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace {

double toMegabytes(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

void ensureParentDirectory(const std::string& file) {
    fs::path path(file);
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
    }
}

} // namespace

std::string ReportWriter::formatTime(TransferReport::Clock::time_point time) {
    auto timeT = TransferReport::Clock::to_time_t(time);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

std::string ReportWriter::csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string ReportWriter::csvHeader() {
    return "timestamp,success,protocol,source_path,target_path,start_time,end_time,duration_seconds,"
           "total_size_mb,transferred_size_mb,transfer_speed_mbps,file_count,directory_count,errors";
}

std::string ReportWriter::csvRow(const TransferReport& report, const std::string& timestamp) {
    std::string row;
    auto add = [&row](const std::string& value) {
        if (!row.empty()) {
            row += ',';
        }
        row += csvField(value);
    };

    add(timestamp);
    add(report.success() ? "SUCCESS" : "FAILED");
    add(report.protocol());
    add(report.sourcePath());
    add(report.targetPath());
    add(formatTime(report.startTime()));
    add(report.endTime() ? formatTime(*report.endTime()) : std::string());
    add(formatDecimal(report.durationSeconds()));
    add(formatDecimal(toMegabytes(report.totalSizeBytes())));
    add(formatDecimal(toMegabytes(report.transferredSizeBytes())));
    add(formatDecimal(report.averageSpeedMBps()));
    add(std::to_string(report.fileCount()));
    add(std::to_string(report.directoryCount()));
    add(report.joinedErrors());
    return row;
}

std::expected<void, std::string> ReportWriter::appendCsv(const TransferReport& report, const std::string& file) {
    ensureParentDirectory(file);
    const bool newFile = !fs::exists(file);

    std::ofstream out(file, std::ios::app);
    if (!out.is_open()) {
        return std::unexpected("Failed to open report file: " + file);
    }
    if (newFile) {
        out << csvHeader() << '\n';
    }
    out << csvRow(report, formatTime(TransferReport::Clock::now())) << '\n';
    out.flush();
    if (!out) {
        return std::unexpected("Failed to write report file: " + file);
    }
    return {};
}

Json::Value ReportWriter::toJson(const TransferReport& report) {
    Json::Value json(Json::objectValue);
    json["success"] = report.success();
    json["protocol"] = report.protocol();
    json["source_path"] = report.sourcePath();
    json["target_path"] = report.targetPath();
    json["start_time"] = formatTime(report.startTime());
    json["end_time"] = report.endTime() ? Json::Value(formatTime(*report.endTime())) : Json::Value(Json::nullValue);
    json["duration_seconds"] = report.durationSeconds();
    json["total_size_bytes"] = Json::Value(static_cast<Json::UInt64>(report.totalSizeBytes()));
    json["transferred_size_bytes"] = Json::Value(static_cast<Json::UInt64>(report.transferredSizeBytes()));
    json["transfer_speed_mbps"] = report.averageSpeedMBps();
    json["file_count"] = Json::Value(static_cast<Json::UInt64>(report.fileCount()));
    json["directory_count"] = Json::Value(static_cast<Json::UInt64>(report.directoryCount()));
    json["source_file_count"] = Json::Value(static_cast<Json::UInt64>(report.sourceFileCount()));
    json["source_directory_count"] = Json::Value(static_cast<Json::UInt64>(report.sourceDirectoryCount()));
    json["final_state"] = toString(report.finalState());

    Json::Value errors(Json::arrayValue);
    for (const auto& error : report.errors()) {
        errors.append(error);
    }
    json["errors"] = errors;

    Json::Value warnings(Json::arrayValue);
    for (const auto& warning : report.warnings()) {
        warnings.append(warning);
    }
    json["warnings"] = warnings;
    return json;
}

std::expected<void, std::string> ReportWriter::writeJson(const TransferReport& report, const std::string& file) {
    ensureParentDirectory(file);
    std::ofstream out(file);
    if (!out.is_open()) {
        return std::unexpected("Failed to open report file for writing: " + file);
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(toJson(report), &out);
    out << '\n';
    if (!out) {
        return std::unexpected("Failed to write report file: " + file);
    }
    return {};
}
