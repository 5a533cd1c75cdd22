#include "parallel_sync.h"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <sstream>

#include <glog/logging.h>

#include "aggregator/progress_aggregator.h"
#include "aggregator/report_writer.h"
#include "bucketer/bucketer.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "inventory/inventory_scanner.h"
#include "scheduler/scheduler.h"
#include "session/remote_target.h"
#include "session/session_multiplexer.h"
#include "transfer/existing_file_filter.h"
#include "transfer/transfer_command.h"

namespace Prsync {

SyncOptions SyncOptions::FromConfiguration(const Configuration& config) {
	const PrsyncConfig& c = config.config();
	SyncOptions options;
	options.jobs = c.transfer.jobs.get();
	options.bucket_size_bytes = c.transfer.bucket_size_bytes.get();
	options.extra_flags = c.transfer.extra_flags.get();
	options.rsync_binary = c.transfer.rsync_binary.get();
	options.skip_existing = c.transfer.skip_existing.get();
	options.work_dir = c.transfer.work_dir.get();
	options.ssh_binary = c.session.ssh_binary.get();
	options.kill_grace_ms = c.scheduler.kill_grace_ms.get();
	options.poll_interval_ms = c.scheduler.poll_interval_ms.get();
	options.report_path = c.report.path.get();
	return options;
}

ParallelSync::ParallelSync(SyncOptions options, CommandRunner& runner)
	: options_(std::move(options)), runner_(runner) {}

void ParallelSync::Validate() const {
	if (options_.jobs < 1) {
		throw ConfigError("jobs must be at least 1, got " + std::to_string(options_.jobs));
	}
	if (options_.bucket_size_bytes == 0) {
		throw ConfigError("bucket size must be greater than 0");
	}
	if (options_.target.empty()) {
		throw ConfigError("no target given");
	}
	std::error_code ec;
	if (!std::filesystem::is_directory(options_.source, ec)) {
		throw ConfigError("source is not a directory: " + options_.source);
	}
}

std::vector<Bucket> ParallelSync::SelectBuckets(std::vector<Bucket> buckets) const {
	if (options_.only_buckets.empty()) {
		return buckets;
	}

	std::set<int> wanted(options_.only_buckets.begin(), options_.only_buckets.end());
	std::ostringstream unknown;
	for (int id : wanted) {
		if (id < 0 || static_cast<size_t>(id) >= buckets.size()) {
			unknown << (unknown.tellp() > 0 ? "," : "") << id;
		}
	}
	if (unknown.tellp() > 0) {
		throw ConfigError("unknown bucket ids: " + unknown.str() + " (run has " +
				std::to_string(buckets.size()) + " buckets)");
	}

	std::vector<Bucket> selected;
	for (auto& bucket : buckets) {
		if (wanted.count(bucket.id)) {
			selected.push_back(std::move(bucket));
		}
	}
	LOG(INFO) << "Restricting run to " << selected.size() << " of " << buckets.size() << " buckets";
	return selected;
}

TransferReport ParallelSync::Run(const CancellationToken& cancel) {
	Validate();

	LOG(INFO) << "Scanning " << options_.source;
	InventoryScanner scanner(options_.source);
	std::vector<FileEntry> files = scanner.Scan();
	if (scanner.GetErrorCount() > 0) {
		LOG(WARNING) << scanner.GetErrorCount() << " entries could not be read and were skipped";
	}
	LOG(INFO) << "Found " << files.size() << " files";

	std::vector<Bucket> buckets = Partition(std::move(files), options_.bucket_size_bytes);
	LOG(INFO) << "Created " << buckets.size() << " buckets (" << TotalBytes(buckets)
	          << " bytes, target " << options_.bucket_size_bytes << " bytes per bucket)";
	buckets = SelectBuckets(std::move(buckets));

	std::optional<RemoteTarget> remote = RemoteTarget::Parse(options_.target);
	if (remote) {
		LOG(INFO) << "Remote destination " << remote->Login() << ":" << remote->path;
	}

	TransferCommandBuilder builder(options_.rsync_binary, SplitFlags(options_.extra_flags),
			options_.source, options_.target, options_.work_dir);
	ProgressAggregator aggregator;

	{
		SessionMultiplexer multiplexer(runner_, options_.ssh_binary);
		SessionGuard session(multiplexer, remote, &cancel);

		std::unique_ptr<ExistenceProbe> probe;
		if (options_.skip_existing) {
			if (remote) {
				probe = std::make_unique<RemoteExistenceProbe>(runner_, session.descriptor(), &cancel);
			} else {
				probe = std::make_unique<LocalExistenceProbe>(options_.target);
			}
		}

		Scheduler scheduler(runner_, builder, session.descriptor(), aggregator,
				options_.jobs, probe.get());
		scheduler.Run(std::move(buckets), cancel);
	}

	TransferReport report = aggregator.Finalize(cancel.IsCancelled());
	LogReport(report);
	if (!options_.report_path.empty()) {
		if (!ReportWriter(options_.report_path).Write(report)) {
			LOG(WARNING) << "Continuing without a report file";
		}
	}
	return report;
}

int ExitStatusFor(const TransferReport& report) {
	return report.AllSucceeded() ? 0 : 1;
}

} // namespace Prsync
