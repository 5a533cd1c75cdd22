#include "bucketer.h"

#include <glog/logging.h>

#include "common/errors.h"

namespace Prsync {

namespace {

bool Fits(const Bucket& open, uint64_t file_size, uint64_t target_bucket_bytes) {
	if (open.files.empty()) {
		return true;
	}
	// open.total_size + file_size <= target, without wrapping around.
	return open.total_size <= target_bucket_bytes &&
	       file_size <= target_bucket_bytes - open.total_size;
}

} // namespace

std::vector<Bucket> Partition(std::vector<FileEntry> files, uint64_t target_bucket_bytes) {
	if (target_bucket_bytes == 0) {
		throw ConfigError("bucket size must be greater than 0");
	}

	std::vector<Bucket> buckets;
	Bucket open;
	open.id = 0;

	for (auto& file : files) {
		if (!Fits(open, file.size, target_bucket_bytes)) {
			VLOG(2) << "Closing bucket " << open.id << " with " << open.files.size()
			        << " files, " << open.total_size << " bytes";
			int next_id = open.id + 1;
			buckets.push_back(std::move(open));
			open = Bucket{};
			open.id = next_id;
		}
		open.total_size += file.size;
		open.files.push_back(std::move(file));
	}

	if (!open.files.empty()) {
		buckets.push_back(std::move(open));
	}

	return buckets;
}

uint64_t TotalBytes(const std::vector<Bucket>& buckets) {
	uint64_t total = 0;
	for (const auto& bucket : buckets) {
		total += bucket.total_size;
	}
	return total;
}

} // namespace Prsync
