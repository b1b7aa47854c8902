#include <gtest/gtest.h>
#include "report_writer.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

class ReportWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("siterelay_report_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::filesystem::remove_all(dir_);

        report_.setTotalSize(2 * 1024 * 1024);
        report_.setTransferredSize(2 * 1024 * 1024);
        report_.setCounts(12, 3);
        report_.setSourceCounts(12, 3);
        report_.addWarning("Target has 1 extra files");
        report_.setFinalState(TransferState::Completed);
        report_.complete(true);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static std::string readFile(const std::filesystem::path& file) {
        std::ifstream in(file);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::filesystem::path dir_;
    TransferReport report_{"SSH", "/home/src/public_html", "/home/dst/public_html"};
};

TEST_F(ReportWriterTest, CsvFieldQuoting) {
    EXPECT_EQ(ReportWriter::csvField("plain"), "plain");
    EXPECT_EQ(ReportWriter::csvField("a,b"), "\"a,b\"");
    EXPECT_EQ(ReportWriter::csvField("say \"hi\""), "\"say \"\"hi\"\"\"");
}

// Test the CSV row layout
TEST_F(ReportWriterTest, CsvRowColumns) {
    std::string row = ReportWriter::csvRow(report_, "2025-01-02 03:04:05");
    EXPECT_EQ(row.rfind("2025-01-02 03:04:05,SUCCESS,SSH,/home/src/public_html,/home/dst/public_html,", 0), 0u);
    EXPECT_NE(row.find(",2.00,2.00,"), std::string::npos);
    EXPECT_NE(row.find(",12,3,"), std::string::npos);
    EXPECT_EQ(row.back(), ',');
}

// Test that the header is written once
TEST_F(ReportWriterTest, AppendCsvWritesHeaderOnce) {
    auto file = dir_ / "reports" / "transfers_results.csv";
    ASSERT_TRUE(ReportWriter::appendCsv(report_, file.string()).has_value());
    ASSERT_TRUE(ReportWriter::appendCsv(report_, file.string()).has_value());

    std::istringstream lines(readFile(file));
    std::string line;
    std::vector<std::string> rows;
    while (std::getline(lines, line)) {
        rows.push_back(line);
    }
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], ReportWriter::csvHeader());
    EXPECT_NE(rows[1].find(",SUCCESS,"), std::string::npos);
}

TEST_F(ReportWriterTest, WritesJsonReport) {
    auto file = dir_ / "report.json";
    ASSERT_TRUE(ReportWriter::writeJson(report_, file.string()).has_value());

    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::ifstream in(file);
    ASSERT_TRUE(Json::parseFromStream(builder, in, &json, &errors)) << errors;

    EXPECT_TRUE(json["success"].asBool());
    EXPECT_EQ(json["protocol"].asString(), "SSH");
    EXPECT_EQ(json["total_size_bytes"].asUInt64(), 2u * 1024u * 1024u);
    EXPECT_EQ(json["file_count"].asUInt64(), 12u);
    EXPECT_EQ(json["final_state"].asString(), "Completed");
    EXPECT_FALSE(json["end_time"].isNull());
    ASSERT_EQ(json["warnings"].size(), 1u);
    EXPECT_EQ(json["warnings"][0].asString(), "Target has 1 extra files");
    EXPECT_EQ(json["errors"].size(), 0u);
}

TEST_F(ReportWriterTest, FailedReportListsErrors) {
    TransferReport failed("SSH", "a", "b");
    failed.addError("PackError: Archive was not created: src:/x");
    failed.setFinalState(TransferState::Failed);
    failed.complete(false);

    Json::Value json = ReportWriter::toJson(failed);
    EXPECT_FALSE(json["success"].asBool());
    EXPECT_EQ(json["final_state"].asString(), "Failed");
    EXPECT_EQ(json["errors"][0].asString(), "PackError: Archive was not created: src:/x");
    EXPECT_EQ(ReportWriter::csvRow(failed, "t").find("t,FAILED,SSH,a,b,"), 0u);
}
