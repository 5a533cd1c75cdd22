#include "scheduler.h"

#include <algorithm>
#include <string>

#include <glog/logging.h>

#include "worker_pool.h"

namespace Prsync {

Scheduler::Scheduler(CommandRunner& runner, const TransferCommandBuilder& builder,
		const TransportDescriptor& transport, ProgressAggregator& aggregator,
		int jobs, ExistenceProbe* probe)
	: runner_(runner),
	  builder_(builder),
	  transport_(transport),
	  aggregator_(aggregator),
	  jobs_(jobs),
	  probe_(probe) {}

void Scheduler::Run(std::vector<Bucket> buckets, const CancellationToken& cancel) {
	aggregator_.Begin(buckets);
	if (buckets.empty()) {
		LOG(INFO) << "Nothing to transfer";
		return;
	}

	size_t num_slots = std::min(static_cast<size_t>(std::max(jobs_, 1)), buckets.size());
	LOG(INFO) << "Dispatching " << buckets.size() << " buckets on " << num_slots << " slots";

	WorkerPool pool(num_slots, cancel);
	SlotCallbacks callbacks;
	callbacks.on_start = [this](const WorkerJob& job) {
		aggregator_.OnJobStarted(job.bucket.id);
	};
	callbacks.run = [this, &cancel](WorkerJob& job) {
		RunJob(job, cancel);
	};
	callbacks.on_finish = [this](const WorkerJob& job) {
		aggregator_.OnJobFinished(job);
	};
	pool.Drain(std::move(buckets), callbacks);
}

void Scheduler::RunJob(WorkerJob& job, const CancellationToken& cancel) {
	const int id = job.bucket.id;
	std::vector<FileEntry> files = job.bucket.files;

	if (probe_) {
		files = FilterExisting(files, *probe_, &job.skipped_files);
		if (files.empty()) {
			LOG(INFO) << "Bucket " << id << ": all " << job.skipped_files
			          << " files already present, nothing to transfer";
			job.state = JobState::kSucceeded;
			return;
		}
	}

	FileListFile list;
	std::string error;
	if (!list.Write(builder_.ListPathFor(id), files, &error)) {
		MarkFailed(job, FailureReason::kSpawnError, error);
		return;
	}

	std::vector<std::string> argv = builder_.Build(list.path(), transport_);
	VLOG(1) << "Bucket " << id << ": " << JoinArgs(argv);

	RunOptions options;
	options.cancel = &cancel;
	options.on_line = [this, &job, id](const std::string& line) {
		job.progress_snapshot = line;
		aggregator_.OnProgress(id, line);
	};

	CommandResult result = runner_.Run(argv, options);

	job.exit_info.exit_code = result.exit_code;
	job.exit_info.term_signal = result.term_signal;
	switch (result.status) {
		case CommandResult::Status::kExited:
			if (result.exit_code == 0) {
				job.state = JobState::kSucceeded;
			} else {
				MarkFailed(job, FailureReason::kTransferError,
						"transfer command exited with code " + std::to_string(result.exit_code));
			}
			break;
		case CommandResult::Status::kSignaled:
			MarkFailed(job, FailureReason::kTransferError, result.error);
			break;
		case CommandResult::Status::kSpawnFailed:
			MarkFailed(job, FailureReason::kSpawnError, result.error);
			break;
		case CommandResult::Status::kCancelled:
			MarkFailed(job, FailureReason::kCancelled, "transfer cancelled");
			break;
	}
}

} // namespace Prsync
