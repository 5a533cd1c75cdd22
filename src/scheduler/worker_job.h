#ifndef PRSYNC_WORKER_JOB_H_
#define PRSYNC_WORKER_JOB_H_

#include <chrono>
#include <cstddef>
#include <string>

#include "bucketer/bucketer.h"

namespace Prsync {

// Pending -> Running -> {Succeeded, Failed}. Pending may also go straight to Failed
// when the run is cancelled before the bucket got a slot.
enum class JobState {
	kPending,
	kRunning,
	kSucceeded,
	kFailed
};

enum class FailureReason {
	kNone,
	kSpawnError,     // The transfer command could not be launched
	kTransferError,  // It ran and exited non-zero or died
	kCancelled       // The run was aborted
};

struct ExitInfo {
	FailureReason reason = FailureReason::kNone;
	int exit_code = -1;
	int term_signal = 0;
	std::string message;
};

/**
 * One bucket's transfer. Created when a pool slot picks the bucket up, mutated only by
 * the worker that runs it, and handed to the aggregator once terminal.
 */
struct WorkerJob {
	explicit WorkerJob(Bucket b) : bucket(std::move(b)) {}

	Bucket bucket;
	JobState state = JobState::kPending;
	ExitInfo exit_info;
	// Latest output line of the transfer command
	std::string progress_snapshot;
	size_t skipped_files = 0;
	std::chrono::steady_clock::time_point started_at;
	std::chrono::steady_clock::time_point finished_at;

	bool IsTerminal() const {
		return state == JobState::kSucceeded || state == JobState::kFailed;
	}
};

// Moves the job to Failed with the given cause
void MarkFailed(WorkerJob& job, FailureReason reason, std::string message);

const char* ToString(JobState state);
const char* ToString(FailureReason reason);

} // namespace Prsync

#endif // PRSYNC_WORKER_JOB_H_
