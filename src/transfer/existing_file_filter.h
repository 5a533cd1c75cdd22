#ifndef PRSYNC_EXISTING_FILE_FILTER_H_
#define PRSYNC_EXISTING_FILE_FILTER_H_

#include <cstddef>
#include <string>
#include <vector>

#include "bucketer/bucketer.h"
#include "command_runner.h"
#include "session/session_multiplexer.h"

namespace Prsync {

/**
 * Answers whether a file already exists at the destination.
 */
class ExistenceProbe {
public:
	virtual ~ExistenceProbe() = default;
	virtual bool Exists(const std::string& relative_path) = 0;
};

// Destination is a local directory.
class LocalExistenceProbe : public ExistenceProbe {
	public:
		explicit LocalExistenceProbe(std::string destination_root);
		bool Exists(const std::string& relative_path) override;

	private:
		std::string destination_root_;
};

// Destination is remote; every check is a `test -f` over the shared session.
class RemoteExistenceProbe : public ExistenceProbe {
	public:
		RemoteExistenceProbe(CommandRunner& runner, const TransportDescriptor& transport,
				const CancellationToken* cancel = nullptr);
		bool Exists(const std::string& relative_path) override;

	private:
		CommandRunner& runner_;
		const TransportDescriptor& transport_;
		const CancellationToken* cancel_;
};

/**
 * Drops the files the probe reports as present.
 * @param skipped Incremented once per dropped file
 * @return Remaining files, order preserved
 */
std::vector<FileEntry> FilterExisting(const std::vector<FileEntry>& files,
		ExistenceProbe& probe, size_t* skipped);

// Wraps a string in single quotes for a POSIX shell.
std::string ShellQuote(const std::string& value);

} // namespace Prsync

#endif // PRSYNC_EXISTING_FILE_FILTER_H_
