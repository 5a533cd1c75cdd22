#include "transfer_command.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include <glog/logging.h>

namespace Prsync {

std::vector<std::string> SplitFlags(const std::string& flags) {
	std::vector<std::string> out;
	std::istringstream in(flags);
	std::string token;
	while (in >> token) {
		out.push_back(token);
	}
	return out;
}

TransferCommandBuilder::TransferCommandBuilder(std::string rsync_binary,
		std::vector<std::string> extra_flags, std::string source_root,
		std::string destination, std::string work_dir)
	: rsync_binary_(std::move(rsync_binary)),
	  extra_flags_(std::move(extra_flags)),
	  source_root_(std::move(source_root)),
	  destination_(std::move(destination)),
	  work_dir_(work_dir.empty() ? "." : std::move(work_dir)) {
	// rsync copies the *contents* of a directory given with a trailing slash
	if (source_root_.empty() || source_root_.back() != '/') {
		source_root_ += '/';
	}
}

std::vector<std::string> TransferCommandBuilder::Build(const std::string& list_path,
		const TransportDescriptor& transport) const {
	std::vector<std::string> argv{rsync_binary_};
	argv.insert(argv.end(), extra_flags_.begin(), extra_flags_.end());
	std::vector<std::string> transport_args = transport.TransportArgs();
	argv.insert(argv.end(), transport_args.begin(), transport_args.end());
	argv.push_back("--from0");
	argv.push_back("--files-from=" + list_path);
	argv.push_back(source_root_);
	argv.push_back(destination_);
	return argv;
}

std::string TransferCommandBuilder::ListPathFor(int bucket_id) const {
	return work_dir_ + "/.prsync_filelist_" + std::to_string(bucket_id);
}

FileListFile::~FileListFile() {
	if (path_.empty()) return;
	if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
		LOG(WARNING) << "Could not remove file list " << path_ << ": " << strerror(errno);
	}
}

bool FileListFile::Write(const std::string& path, const std::vector<FileEntry>& files,
		std::string* error) {
	path_ = path;
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out.is_open()) {
		*error = "cannot create file list " + path + ": " + strerror(errno);
		return false;
	}
	for (const auto& file : files) {
		out << file.path << '\0';
	}
	out.close();
	if (!out) {
		*error = "cannot write file list " + path;
		return false;
	}
	return true;
}

} // namespace Prsync
