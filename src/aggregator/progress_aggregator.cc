#include "progress_aggregator.h"

#include <algorithm>
#include <iomanip>

#include <glog/logging.h>

namespace Prsync {

namespace {

double SecondsBetween(std::chrono::steady_clock::time_point from,
		std::chrono::steady_clock::time_point to) {
	return std::chrono::duration<double>(to - from).count();
}

} // namespace

void ProgressAggregator::Begin(const std::vector<Bucket>& buckets) {
	absl::MutexLock lock(&mutex_);
	records_.clear();
	total_files_ = 0;
	total_bytes_ = 0;
	files_done_ = 0;
	running_ = 0;
	peak_running_ = 0;
	start_time_ = std::chrono::steady_clock::now();

	for (const auto& bucket : buckets) {
		BucketRecord record;
		record.outcome.id = bucket.id;
		record.outcome.num_files = bucket.files.size();
		record.outcome.total_size = bucket.total_size;
		record.outcome.state = JobState::kPending;
		records_[bucket.id] = std::move(record);
		total_files_ += bucket.files.size();
		total_bytes_ += bucket.total_size;
	}
}

void ProgressAggregator::OnJobStarted(int bucket_id) {
	absl::MutexLock lock(&mutex_);
	auto it = records_.find(bucket_id);
	if (it == records_.end()) {
		LOG(WARNING) << "Start event for unknown bucket " << bucket_id;
		return;
	}
	if (it->second.outcome.state != JobState::kPending) {
		LOG(WARNING) << "Bucket " << bucket_id << " started twice";
		return;
	}
	it->second.outcome.state = JobState::kRunning;
	running_++;
	peak_running_ = std::max(peak_running_, running_);
	VLOG(1) << "Bucket " << bucket_id << " running (" << it->second.outcome.num_files
	        << " files, " << running_ << " running)";
}

void ProgressAggregator::OnProgress(int bucket_id, const std::string& line) {
	absl::MutexLock lock(&mutex_);
	auto it = records_.find(bucket_id);
	if (it == records_.end()) {
		return;
	}
	BucketRecord& record = it->second;
	record.progress_snapshot = line;
	record.tail.push_back(line);
	if (record.tail.size() > kOutputTailLines) {
		record.tail.pop_front();
	}
	VLOG(2) << "[bucket " << bucket_id << "] " << line;
	if (listener_) {
		listener_(bucket_id, line);
	}
}

void ProgressAggregator::OnJobFinished(const WorkerJob& job) {
	if (!job.IsTerminal()) {
		LOG(ERROR) << "Bucket " << job.bucket.id << " reported finished while "
		           << ToString(job.state);
		return;
	}

	absl::MutexLock lock(&mutex_);
	auto it = records_.find(job.bucket.id);
	if (it == records_.end()) {
		LOG(WARNING) << "Finish event for unknown bucket " << job.bucket.id;
		return;
	}
	BucketRecord& record = it->second;
	if (record.outcome.state == JobState::kSucceeded || record.outcome.state == JobState::kFailed) {
		LOG(WARNING) << "Bucket " << job.bucket.id << " finished twice";
		return;
	}
	if (record.outcome.state == JobState::kRunning) {
		running_--;
	}

	BucketOutcome& outcome = record.outcome;
	outcome.state = job.state;
	outcome.exit_info = job.exit_info;
	outcome.skipped_files = job.skipped_files;
	if (job.started_at != std::chrono::steady_clock::time_point{}) {
		outcome.elapsed_seconds = SecondsBetween(job.started_at, job.finished_at);
	}
	outcome.output_tail.assign(record.tail.begin(), record.tail.end());

	files_done_ += outcome.num_files;

	if (job.state == JobState::kSucceeded) {
		LOG(INFO) << "Bucket " << outcome.id << " done in " << std::fixed << std::setprecision(1)
		          << outcome.elapsed_seconds << "s (" << outcome.num_files << " files)";
	} else {
		LOG(ERROR) << "Bucket " << outcome.id << " failed (" << ToString(outcome.exit_info.reason)
		           << "): " << outcome.exit_info.message;
	}

	double progress = total_files_ == 0 ? 100.0 : (100.0 * files_done_) / total_files_;
	LOG(INFO) << "Progress: " << std::fixed << std::setprecision(1) << progress << "% ("
	          << files_done_ << "/" << total_files_ << ")";
}

TransferReport ProgressAggregator::Finalize(bool cancelled) {
	absl::MutexLock lock(&mutex_);
	TransferReport report;
	report.total_buckets = records_.size();
	report.total_files = total_files_;
	report.total_bytes = total_bytes_;
	report.cancelled = cancelled;
	report.wall_time_seconds = SecondsBetween(start_time_, std::chrono::steady_clock::now());

	for (auto& [id, record] : records_) {
		BucketOutcome outcome = record.outcome;
		if (outcome.state == JobState::kSucceeded) {
			report.succeeded++;
		} else {
			if (outcome.state != JobState::kFailed) {
				LOG(ERROR) << "Bucket " << id << " never reached a terminal state";
				outcome.state = JobState::kFailed;
				if (outcome.exit_info.reason == FailureReason::kNone) {
					outcome.exit_info.reason = cancelled ? FailureReason::kCancelled
					                                     : FailureReason::kTransferError;
					outcome.exit_info.message = "no outcome recorded";
				}
			}
			report.failed++;
			report.failed_bucket_ids.push_back(id);
		}
		report.skipped_files += outcome.skipped_files;
		report.buckets.push_back(std::move(outcome));
	}
	return report;
}

void ProgressAggregator::SetProgressListener(ProgressListener listener) {
	absl::MutexLock lock(&mutex_);
	listener_ = std::move(listener);
}

JobState ProgressAggregator::GetState(int bucket_id) const {
	absl::MutexLock lock(&mutex_);
	auto it = records_.find(bucket_id);
	return it == records_.end() ? JobState::kPending : it->second.outcome.state;
}

std::string ProgressAggregator::GetProgressSnapshot(int bucket_id) const {
	absl::MutexLock lock(&mutex_);
	auto it = records_.find(bucket_id);
	return it == records_.end() ? std::string() : it->second.progress_snapshot;
}

int ProgressAggregator::GetRunningCount() const {
	absl::MutexLock lock(&mutex_);
	return running_;
}

int ProgressAggregator::GetPeakRunningCount() const {
	absl::MutexLock lock(&mutex_);
	return peak_running_;
}

} // namespace Prsync
