#ifndef PRSYNC_SCHEDULER_H_
#define PRSYNC_SCHEDULER_H_

#include <vector>

#include "aggregator/progress_aggregator.h"
#include "common/cancellation.h"
#include "session/session_multiplexer.h"
#include "transfer/command_runner.h"
#include "transfer/existing_file_filter.h"
#include "transfer/transfer_command.h"
#include "worker_job.h"

namespace Prsync {

/**
 * Drives every bucket to a terminal state with at most `jobs` transfers in flight.
 *
 * Buckets are dispatched in the order given; whenever a transfer finishes its slot
 * takes the next pending bucket. A failing bucket never stops the others. On
 * cancellation running transfers are terminated and buckets not yet started are
 * failed without being launched.
 */
class Scheduler {
	public:
		/**
		 * @param runner Launches the transfer commands
		 * @param builder Turns a bucket into an argument vector
		 * @param transport Shared session; must stay open until Run() returns
		 * @param aggregator Receives all progress and outcome events
		 * @param jobs Concurrency bound, at least 1
		 * @param probe Optional existing-file filter applied before each launch
		 */
		Scheduler(CommandRunner& runner, const TransferCommandBuilder& builder,
				const TransportDescriptor& transport, ProgressAggregator& aggregator,
				int jobs, ExistenceProbe* probe = nullptr);

		/**
		 * Blocks until every bucket is Succeeded or Failed.
		 * Calls aggregator.Begin() with the buckets first.
		 */
		void Run(std::vector<Bucket> buckets, const CancellationToken& cancel);

	private:
		void RunJob(WorkerJob& job, const CancellationToken& cancel);

		CommandRunner& runner_;
		const TransferCommandBuilder& builder_;
		const TransportDescriptor& transport_;
		ProgressAggregator& aggregator_;
		const int jobs_;
		ExistenceProbe* probe_;
};

} // namespace Prsync

#endif // PRSYNC_SCHEDULER_H_
