#ifndef PRSYNC_PROCESS_RUNNER_H_
#define PRSYNC_PROCESS_RUNNER_H_

#include "command_runner.h"

namespace Prsync {

/**
 * CommandRunner backed by fork/execvp.
 *
 * The child runs in its own process group with an empty signal mask and stdin on
 * /dev/null; stdout and stderr share one pipe. On cancellation the whole group gets
 * SIGTERM, and SIGKILL once the grace period has run out.
 */
class ProcessRunner : public CommandRunner {
	public:
		/**
		 * @param kill_grace_ms Time between SIGTERM and SIGKILL after cancellation
		 * @param poll_interval_ms Upper bound on how long a worker waits for output
		 *        before re-checking its cancellation token
		 */
		explicit ProcessRunner(int kill_grace_ms = 5000, int poll_interval_ms = 200);

		CommandResult Run(const std::vector<std::string>& argv, const RunOptions& options) override;

	private:
		const int kill_grace_ms_;
		const int poll_interval_ms_;
};

} // namespace Prsync

#endif // PRSYNC_PROCESS_RUNNER_H_
