#include "existing_file_filter.h"

#include <filesystem>
#include <system_error>

#include <glog/logging.h>

namespace Prsync {

std::string ShellQuote(const std::string& value) {
	std::string quoted = "'";
	for (char c : value) {
		if (c == '\'') {
			quoted += "'\\''";
		} else {
			quoted += c;
		}
	}
	quoted += "'";
	return quoted;
}

LocalExistenceProbe::LocalExistenceProbe(std::string destination_root)
	: destination_root_(std::move(destination_root)) {}

bool LocalExistenceProbe::Exists(const std::string& relative_path) {
	std::error_code ec;
	return std::filesystem::is_regular_file(
			std::filesystem::path(destination_root_) / relative_path, ec);
}

RemoteExistenceProbe::RemoteExistenceProbe(CommandRunner& runner,
		const TransportDescriptor& transport, const CancellationToken* cancel)
	: runner_(runner), transport_(transport), cancel_(cancel) {}

bool RemoteExistenceProbe::Exists(const std::string& relative_path) {
	if (!transport_.remote()) {
		return false;
	}
	std::vector<std::string> argv = transport_.RemoteCommandPrefix();
	argv.push_back("test -f " + ShellQuote(transport_.remote()->path + "/" + relative_path));

	RunOptions options;
	options.cancel = cancel_;
	CommandResult result = runner_.Run(argv, options);
	if (result.status == CommandResult::Status::kSpawnFailed) {
		LOG(WARNING) << "Remote existence check failed for " << relative_path << ": " << result.error;
	}
	return result.Succeeded();
}

std::vector<FileEntry> FilterExisting(const std::vector<FileEntry>& files,
		ExistenceProbe& probe, size_t* skipped) {
	std::vector<FileEntry> remaining;
	remaining.reserve(files.size());
	for (const auto& file : files) {
		if (probe.Exists(file.path)) {
			VLOG(1) << "Skipping existing file: " << file.path;
			(*skipped)++;
		} else {
			remaining.push_back(file);
		}
	}
	return remaining;
}

} // namespace Prsync
