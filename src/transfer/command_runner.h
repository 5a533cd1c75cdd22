#ifndef PRSYNC_COMMAND_RUNNER_H_
#define PRSYNC_COMMAND_RUNNER_H_

#include <functional>
#include <string>
#include <vector>

#include "common/cancellation.h"

namespace Prsync {

/**
 * Outcome of one external command.
 */
struct CommandResult {
	enum class Status {
		kExited,       // Ran to completion; exit_code is valid
		kSignaled,     // Killed by a signal nobody here sent, or stopped for terminal input and
		               // killed; term_signal is valid
		kSpawnFailed,  // Never started; error describes why
		kCancelled     // Terminated because the cancellation token fired
	};

	Status status = Status::kSpawnFailed;
	int exit_code = -1;
	int term_signal = 0;
	std::string error;

	bool Succeeded() const { return status == Status::kExited && exit_code == 0; }
};

/**
 * Receives the command's merged stdout/stderr, one line at a time, in the order the
 * command wrote them. Carriage returns terminate a line as well, so rsync --progress
 * updates arrive as separate lines.
 */
using LineCallback = std::function<void(const std::string& line)>;

struct RunOptions {
	// Checked while the command runs; null means the command cannot be cancelled.
	const CancellationToken* cancel = nullptr;
	LineCallback on_line;
	// When false the command's output is discarded instead of piped back.
	bool capture_output = true;
	// When true the command gets a process group of its own and cancellation signals the
	// whole group. When false it stays in ours, so it can prompt on the controlling
	// terminal (ssh asking for a password) and receives the terminal's Ctrl-C directly.
	bool own_process_group = true;
};

/**
 * Narrow seam in front of every external process (rsync, ssh). The scheduler and the
 * session multiplexer only talk to this interface, so tests drive them with fakes.
 * Implementations must be safe to call from several threads at once.
 */
class CommandRunner {
public:
	virtual ~CommandRunner() = default;

	/**
	 * Runs argv[0] with the given arguments and blocks until it terminates.
	 * @param argv Program followed by its arguments; argv[0] is looked up in PATH
	 * @param options Cancellation and output handling
	 */
	virtual CommandResult Run(const std::vector<std::string>& argv, const RunOptions& options) = 0;
};

// Human-readable form of argv for logs
std::string JoinArgs(const std::vector<std::string>& argv);

} // namespace Prsync

#endif // PRSYNC_COMMAND_RUNNER_H_
