#ifndef PRSYNC_PARALLEL_SYNC_H_
#define PRSYNC_PARALLEL_SYNC_H_

#include <cstddef>
#include <string>
#include <vector>

#include "aggregator/transfer_report.h"
#include "common/cancellation.h"
#include "transfer/command_runner.h"

namespace Prsync {

class Configuration;

/**
 * Everything one run needs. Defaults match the configuration defaults.
 */
struct SyncOptions {
	std::string source;
	std::string target;

	int jobs = 4;
	size_t bucket_size_bytes = 1000000000UL;
	std::string extra_flags = "-avz --progress";
	std::string rsync_binary = "rsync";
	std::string ssh_binary = "ssh";
	int kill_grace_ms = 5000;
	int poll_interval_ms = 200;
	bool skip_existing = false;
	std::string work_dir;
	std::string report_path;
	// Restricts the run to these bucket ids; empty runs all of them
	std::vector<int> only_buckets;

	// Fills every tunable from the effective configuration; source and target stay empty.
	static SyncOptions FromConfiguration(const Configuration& config);
};

/**
 * Scanner -> Bucketer -> Session -> Scheduler -> Aggregator for one source/target pair.
 */
class ParallelSync {
	public:
		/**
		 * @param runner Runs rsync and ssh; must outlive the object
		 */
		ParallelSync(SyncOptions options, CommandRunner& runner);

		/**
		 * Transfers the source tree. Per-bucket failures end up in the report; only
		 * conditions that prevent any transfer from starting are thrown.
		 * @throws ConfigError on invalid options, a missing source or unknown bucket ids
		 * @throws AuthError, ConnectError if the shared session cannot be opened
		 */
		TransferReport Run(const CancellationToken& cancel);

	private:
		void Validate() const;
		std::vector<Bucket> SelectBuckets(std::vector<Bucket> buckets) const;

		SyncOptions options_;
		CommandRunner& runner_;
};

/**
 * Process exit status for a finished run: 0 if every bucket succeeded, 1 otherwise.
 * Fatal errors that never produced a report map to kFatalExitStatus.
 */
int ExitStatusFor(const TransferReport& report);

constexpr int kFatalExitStatus = 2;

} // namespace Prsync

#endif // PRSYNC_PARALLEL_SYNC_H_
