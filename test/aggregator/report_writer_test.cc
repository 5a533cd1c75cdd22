#include <gtest/gtest.h>
#include "../../src/aggregator/report_writer.h"

#include <filesystem>
#include <string>

#include <unistd.h>
#include <yaml-cpp/yaml.h>

using namespace Prsync;
namespace fs = std::filesystem;

class ReportWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        report_.total_buckets = 3;
        report_.succeeded = 2;
        report_.failed = 1;
        report_.failed_bucket_ids = {2};
        report_.wall_time_seconds = 12.5;
        report_.total_files = 9;
        report_.total_bytes = 2700;

        for (int id = 0; id < 3; ++id) {
            BucketOutcome outcome;
            outcome.id = id;
            outcome.num_files = 3;
            outcome.total_size = 900;
            outcome.state = id == 2 ? JobState::kFailed : JobState::kSucceeded;
            if (id == 2) {
                outcome.exit_info.reason = FailureReason::kTransferError;
                outcome.exit_info.exit_code = 23;
                outcome.exit_info.message = "transfer command exited with code 23";
                outcome.output_tail = {"rsync: link_stat failed", "rsync error: some files could not be transferred"};
            }
            report_.buckets.push_back(outcome);
        }

        dir_ = fs::temp_directory_path() / ("prsync_report_test_" + std::to_string(::getpid()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    TransferReport report_;
    fs::path dir_;
};

TEST_F(ReportWriterTest, YamlCarriesSummaryAndFailures) {
    YAML::Node doc = YAML::Load(ReportWriter::ToYAML(report_));

    EXPECT_EQ(doc["total_buckets"].as<int>(), 3);
    EXPECT_EQ(doc["succeeded"].as<int>(), 2);
    EXPECT_EQ(doc["failed_bucket_ids"].as<std::vector<int>>(), std::vector<int>{2});
    EXPECT_FALSE(doc["cancelled"].as<bool>());

    YAML::Node buckets = doc["buckets"];
    ASSERT_EQ(buckets.size(), 3u);
    EXPECT_EQ(buckets[0]["state"].as<std::string>(), "Succeeded");
    EXPECT_FALSE(buckets[0]["reason"]) << "Succeeded buckets carry no failure details";
    EXPECT_EQ(buckets[2]["state"].as<std::string>(), "Failed");
    EXPECT_EQ(buckets[2]["reason"].as<std::string>(), "TransferError");
    EXPECT_EQ(buckets[2]["exit_code"].as<int>(), 23);
    EXPECT_EQ(buckets[2]["output_tail"].size(), 2u);
}

TEST_F(ReportWriterTest, WritesFileCreatingParentDirectories) {
    fs::path path = dir_ / "nested" / "report.yaml";
    ASSERT_TRUE(ReportWriter(path.string()).Write(report_));

    YAML::Node doc = YAML::LoadFile(path.string());
    EXPECT_EQ(doc["total_files"].as<size_t>(), 9u);
}

TEST_F(ReportWriterTest, UnwritablePathFails) {
    EXPECT_FALSE(ReportWriter("/proc/prsync_cannot_write_here/report.yaml").Write(report_));
}

TEST_F(ReportWriterTest, LogReportHandlesAllOutcomes) {
    LogReport(report_);
    report_.failed = 0;
    report_.failed_bucket_ids.clear();
    report_.buckets[2].state = JobState::kSucceeded;
    LogReport(report_);
    SUCCEED();
}
