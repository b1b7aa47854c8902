/**
 * @file report_writer.hpp
 * @brief Persists transfer reports as CSV rows and JSON documents.
 *
 * The CSV file is a running log of transfers: each run appends one row and the
 * header is written only when the file is new.
 */

#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include <expected>
#include <string>
#include <json/json.h>
#include "transfer_report.hpp"

/**
 * @brief Serializes TransferReport instances.
 */
class ReportWriter {
public:
    /**
     * @brief Appends one row for @p report to a CSV file.
     *
     * Columns: timestamp, success, protocol, source_path, target_path,
     * start_time, end_time, duration_seconds, total_size_mb,
     * transferred_size_mb, transfer_speed_mbps, file_count, directory_count,
     * errors.
     *
     * @param report Completed report.
     * @param file CSV file; created with a header row when missing.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> appendCsv(const TransferReport& report, const std::string& file);

    /**
     * @brief Writes @p report as a JSON document, replacing @p file.
     *
     * @param report Completed report.
     * @param file Output path.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> writeJson(const TransferReport& report, const std::string& file);

    /**
     * @brief Converts a report into a JSON object.
     */
    static Json::Value toJson(const TransferReport& report);

    /**
     * @brief Header row of the CSV file, without a line terminator.
     */
    static std::string csvHeader();

    /**
     * @brief Data row for a report, without a line terminator.
     *
     * @param report Report to render.
     * @param timestamp Value of the timestamp column.
     */
    static std::string csvRow(const TransferReport& report, const std::string& timestamp);

    /**
     * @brief Quotes a CSV field when it contains a comma, quote or line break.
     */
    static std::string csvField(const std::string& value);

    /**
     * @brief Formats a time point as local "%Y-%m-%d %H:%M:%S".
     */
    static std::string formatTime(TransferReport::Clock::time_point time);
};

#endif // REPORT_WRITER_HPP
