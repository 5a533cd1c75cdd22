#ifndef PRSYNC_TRANSFER_REPORT_H_
#define PRSYNC_TRANSFER_REPORT_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "scheduler/worker_job.h"

namespace Prsync {

/**
 * Final state of one bucket, kept after its WorkerJob is gone.
 */
struct BucketOutcome {
	int id = 0;
	size_t num_files = 0;
	uint64_t total_size = 0;
	JobState state = JobState::kPending;
	ExitInfo exit_info;
	size_t skipped_files = 0;
	double elapsed_seconds = 0;
	// Last lines the transfer command printed, oldest first
	std::vector<std::string> output_tail;
};

/**
 * Summary of a whole run.
 */
struct TransferReport {
	size_t total_buckets = 0;
	size_t succeeded = 0;
	size_t failed = 0;
	// Ascending
	std::vector<int> failed_bucket_ids;
	double wall_time_seconds = 0;

	size_t total_files = 0;
	uint64_t total_bytes = 0;
	size_t skipped_files = 0;
	bool cancelled = false;
	// Ordered by bucket id
	std::vector<BucketOutcome> buckets;

	bool AllSucceeded() const { return failed == 0 && !cancelled; }
};

} // namespace Prsync

#endif // PRSYNC_TRANSFER_REPORT_H_
