#include "worker_job.h"

#include <utility>

namespace Prsync {

void MarkFailed(WorkerJob& job, FailureReason reason, std::string message) {
	job.state = JobState::kFailed;
	job.exit_info.reason = reason;
	job.exit_info.message = std::move(message);
}

const char* ToString(JobState state) {
	switch (state) {
		case JobState::kPending:
			return "Pending";
		case JobState::kRunning:
			return "Running";
		case JobState::kSucceeded:
			return "Succeeded";
		case JobState::kFailed:
			return "Failed";
	}
	return "Unknown";
}

const char* ToString(FailureReason reason) {
	switch (reason) {
		case FailureReason::kNone:
			return "None";
		case FailureReason::kSpawnError:
			return "SpawnError";
		case FailureReason::kTransferError:
			return "TransferError";
		case FailureReason::kCancelled:
			return "Cancelled";
	}
	return "Unknown";
}

} // namespace Prsync
