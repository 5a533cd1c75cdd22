#include "report_writer.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Prsync {

ReportWriter::ReportWriter(std::string path) : path_(std::move(path)) {}

std::string ReportWriter::ToYAML(const TransferReport& report) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "total_buckets" << YAML::Value << report.total_buckets;
    out << YAML::Key << "succeeded" << YAML::Value << report.succeeded;
    out << YAML::Key << "failed" << YAML::Value << report.failed;
    out << YAML::Key << "failed_bucket_ids" << YAML::Value << YAML::Flow << report.failed_bucket_ids;
    out << YAML::Key << "wall_time_seconds" << YAML::Value << report.wall_time_seconds;
    out << YAML::Key << "total_files" << YAML::Value << report.total_files;
    out << YAML::Key << "total_bytes" << YAML::Value << report.total_bytes;
    out << YAML::Key << "skipped_files" << YAML::Value << report.skipped_files;
    out << YAML::Key << "cancelled" << YAML::Value << report.cancelled;

    out << YAML::Key << "buckets" << YAML::Value << YAML::BeginSeq;
    for (const auto& bucket : report.buckets) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << bucket.id;
        out << YAML::Key << "state" << YAML::Value << ToString(bucket.state);
        out << YAML::Key << "files" << YAML::Value << bucket.num_files;
        out << YAML::Key << "bytes" << YAML::Value << bucket.total_size;
        out << YAML::Key << "elapsed_seconds" << YAML::Value << bucket.elapsed_seconds;
        if (bucket.skipped_files > 0) {
            out << YAML::Key << "skipped_files" << YAML::Value << bucket.skipped_files;
        }
        if (bucket.state == JobState::kFailed) {
            out << YAML::Key << "reason" << YAML::Value << ToString(bucket.exit_info.reason);
            out << YAML::Key << "exit_code" << YAML::Value << bucket.exit_info.exit_code;
            if (bucket.exit_info.term_signal != 0) {
                out << YAML::Key << "signal" << YAML::Value << bucket.exit_info.term_signal;
            }
            out << YAML::Key << "message" << YAML::Value << bucket.exit_info.message;
            out << YAML::Key << "output_tail" << YAML::Value << bucket.output_tail;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

bool ReportWriter::Write(const TransferReport& report) const {
    try {
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
    } catch (const fs::filesystem_error& e) {
        LOG(ERROR) << "Failed to create report directory: " << e.what();
        return false;
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        LOG(ERROR) << "Could not open report file " << path_ << ": " << strerror(errno);
        return false;
    }
    file << ToYAML(report) << "\n";
    file.close();
    if (!file) {
        LOG(ERROR) << "Could not write report file " << path_;
        return false;
    }

    LOG(INFO) << "Report written to: " << path_;
    return true;
}

void LogReport(const TransferReport& report) {
    LOG(INFO) << "Transfer completed in " << std::fixed << std::setprecision(1)
              << report.wall_time_seconds << " seconds";
    LOG(INFO) << "Successfully transferred: " << report.succeeded << "/" << report.total_buckets
              << " buckets (" << report.total_files << " files, " << report.total_bytes << " bytes)";
    if (report.skipped_files > 0) {
        LOG(INFO) << "Skipped existing files: " << report.skipped_files;
    }
    if (report.cancelled) {
        LOG(WARNING) << "Transfer was cancelled";
    }
    if (report.failed == 0) {
        return;
    }

    std::ostringstream ids;
    for (size_t i = 0; i < report.failed_bucket_ids.size(); ++i) {
        if (i) ids << ",";
        ids << report.failed_bucket_ids[i];
    }
    LOG(ERROR) << "Failed transfers: " << report.failed << " buckets (ids: " << ids.str() << ")";
    for (const auto& bucket : report.buckets) {
        if (bucket.state != JobState::kFailed) continue;
        LOG(ERROR) << "Bucket " << bucket.id << " failed with " << ToString(bucket.exit_info.reason)
                   << ": " << bucket.exit_info.message;
        for (const auto& line : bucket.output_tail) {
            LOG(ERROR) << "  [bucket " << bucket.id << "] " << line;
        }
    }
    LOG(ERROR) << "Re-run the failed buckets with --only-buckets " << ids.str();
}

} // namespace Prsync
