#ifndef PRSYNC_PROGRESS_AGGREGATOR_H_
#define PRSYNC_PROGRESS_AGGREGATOR_H_

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "transfer_report.h"

namespace Prsync {

/**
 * Collects progress lines and terminal outcomes from all workers and builds the
 * TransferReport. Every method may be called concurrently from worker threads.
 *
 * Lines of one bucket reach the listener in the order the worker emitted them;
 * lines of different buckets interleave freely.
 */
class ProgressAggregator {
	public:
		using ProgressListener = std::function<void(int bucket_id, const std::string& line)>;

		static constexpr size_t kOutputTailLines = 20;

		ProgressAggregator() = default;

		/**
		 * Registers every bucket of the run as Pending and starts the wall clock.
		 */
		void Begin(const std::vector<Bucket>& buckets);

		// Pending -> Running
		void OnJobStarted(int bucket_id);

		void OnProgress(int bucket_id, const std::string& line);

		/**
		 * Records a terminal WorkerJob and logs overall progress.
		 */
		void OnJobFinished(const WorkerJob& job);

		/**
		 * Builds the report. Buckets still not terminal are counted as failed.
		 * @param cancelled Whether the run was aborted
		 */
		TransferReport Finalize(bool cancelled);

		// Called for every progress line, under the aggregator's lock
		void SetProgressListener(ProgressListener listener);

		JobState GetState(int bucket_id) const;
		std::string GetProgressSnapshot(int bucket_id) const;
		int GetRunningCount() const;
		// Highest number of buckets that were Running at the same time
		int GetPeakRunningCount() const;

	private:
		struct BucketRecord {
			BucketOutcome outcome;
			std::string progress_snapshot;
			std::deque<std::string> tail;
		};

		mutable absl::Mutex mutex_;
		std::map<int, BucketRecord> records_ ABSL_GUARDED_BY(mutex_);
		ProgressListener listener_ ABSL_GUARDED_BY(mutex_);
		std::chrono::steady_clock::time_point start_time_ ABSL_GUARDED_BY(mutex_);
		size_t total_files_ ABSL_GUARDED_BY(mutex_) = 0;
		uint64_t total_bytes_ ABSL_GUARDED_BY(mutex_) = 0;
		size_t files_done_ ABSL_GUARDED_BY(mutex_) = 0;
		int running_ ABSL_GUARDED_BY(mutex_) = 0;
		int peak_running_ ABSL_GUARDED_BY(mutex_) = 0;
};

} // namespace Prsync

#endif // PRSYNC_PROGRESS_AGGREGATOR_H_
