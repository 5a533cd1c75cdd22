#ifndef PRSYNC_TRANSFER_COMMAND_H_
#define PRSYNC_TRANSFER_COMMAND_H_

#include <string>
#include <vector>

#include "bucketer/bucketer.h"
#include "session/session_multiplexer.h"

namespace Prsync {

/**
 * Splits a flag string on whitespace; no quoting rules are applied.
 */
std::vector<std::string> SplitFlags(const std::string& flags);

/**
 * Assembles one rsync invocation per bucket:
 *   rsync <extra flags...> [-e "ssh -o ControlPath=..."] --from0 --files-from=<list> <source>/ <destination>
 * Extra flags are passed through untouched.
 */
class TransferCommandBuilder {
	public:
		/**
		 * @param rsync_binary Program to run, looked up in PATH
		 * @param extra_flags Caller's flags, already split
		 * @param source_root Local source directory
		 * @param destination Local directory or [user@]host:path
		 * @param work_dir Directory receiving the per-bucket list files; empty means "."
		 */
		TransferCommandBuilder(std::string rsync_binary, std::vector<std::string> extra_flags,
				std::string source_root, std::string destination, std::string work_dir);

		std::vector<std::string> Build(const std::string& list_path,
				const TransportDescriptor& transport) const;

		// <work_dir>/.prsync_filelist_<bucket_id>
		std::string ListPathFor(int bucket_id) const;

		const std::string& destination() const { return destination_; }

	private:
		std::string rsync_binary_;
		std::vector<std::string> extra_flags_;
		std::string source_root_;
		std::string destination_;
		std::string work_dir_;
};

/**
 * The --files-from list of one bucket on disk. Removed when the object goes away,
 * whatever the outcome of the transfer.
 */
class FileListFile {
	public:
		FileListFile() = default;
		~FileListFile();

		FileListFile(const FileListFile&) = delete;
		FileListFile& operator=(const FileListFile&) = delete;

		/**
		 * Writes the relative paths NUL-terminated, so names may contain newlines.
		 * @param error Receives the reason on failure
		 * @return false if the file could not be written completely
		 */
		bool Write(const std::string& path, const std::vector<FileEntry>& files, std::string* error);

		const std::string& path() const { return path_; }

	private:
		std::string path_;
};

} // namespace Prsync

#endif // PRSYNC_TRANSFER_COMMAND_H_
