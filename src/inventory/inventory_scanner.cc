#include "inventory_scanner.h"

#include <algorithm>
#include <system_error>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace Prsync {

InventoryScanner::InventoryScanner(fs::path root) : root_(std::move(root)) {}

std::vector<FileEntry> InventoryScanner::Scan() {
	error_count_ = 0;
	std::vector<FileEntry> files;
	LOG(INFO) << "Scanning directory: " << root_.string();
	ScanDirectory(root_, files);
	return files;
}

void InventoryScanner::ScanDirectory(const fs::path& dir, std::vector<FileEntry>& out) {
	std::error_code ec;
	std::vector<fs::directory_entry> entries;
	for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
		entries.push_back(*it);
	}
	if (ec) {
		LOG(ERROR) << "Error reading directory " << dir.string() << ": " << ec.message();
		error_count_++;
		return;
	}

	std::sort(entries.begin(), entries.end(),
			[](const fs::directory_entry& a, const fs::directory_entry& b) {
				return a.path().filename() < b.path().filename();
			});

	for (const auto& entry : entries) {
		const fs::path& path = entry.path();
		fs::file_status link_status = entry.symlink_status(ec);
		if (ec) {
			LOG(ERROR) << "Error accessing file " << path.string() << ": " << ec.message();
			error_count_++;
			continue;
		}

		if (fs::is_directory(link_status)) {
			ScanDirectory(path, out);
			continue;
		}

		// Follows symlinks; a dangling link fails here.
		fs::file_status status = entry.status(ec);
		if (ec) {
			LOG(ERROR) << "Error accessing file " << path.string() << ": " << ec.message();
			error_count_++;
			continue;
		}
		if (!fs::is_regular_file(status)) {
			VLOG(2) << "Skipping non-regular entry " << path.string();
			continue;
		}

		uint64_t size = fs::file_size(path, ec);
		if (ec) {
			LOG(ERROR) << "Error accessing file " << path.string() << ": " << ec.message();
			error_count_++;
			continue;
		}
		out.push_back(FileEntry{path.lexically_relative(root_).generic_string(), size});
	}
}

} // namespace Prsync
