#ifndef PRSYNC_INVENTORY_SCANNER_H_
#define PRSYNC_INVENTORY_SCANNER_H_

#include <cstddef>
#include <filesystem>
#include <vector>

#include "bucketer/bucketer.h"

namespace Prsync {

/**
 * Walks a source tree and produces the flat (relative path, size) inventory.
 *
 * Entries of each directory are visited in lexicographic order so that scanning an
 * unchanged tree twice yields the same inventory and therefore the same bucket ids.
 * Regular files are reported, following symlinks; symlinked directories are not
 * descended. Entries that cannot be inspected are logged and skipped.
 */
class InventoryScanner {
	public:
		explicit InventoryScanner(std::filesystem::path root);

		std::vector<FileEntry> Scan();

		// Number of entries skipped by the last Scan() because they could not be read
		size_t GetErrorCount() const { return error_count_; }

	private:
		void ScanDirectory(const std::filesystem::path& dir, std::vector<FileEntry>& out);

		std::filesystem::path root_;
		size_t error_count_ = 0;
};

} // namespace Prsync

#endif // PRSYNC_INVENTORY_SCANNER_H_
