#include "process_runner.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>

#include "common/scoped_fd.h"

namespace Prsync {

std::string JoinArgs(const std::vector<std::string>& argv) {
	std::string joined;
	for (const auto& arg : argv) {
		if (!joined.empty()) joined += ' ';
		joined += arg;
	}
	return joined;
}

namespace {

// Splits buffered output into lines and hands every complete line to the callback.
// Empty segments (the "\r\n" that ends an rsync progress line) are dropped.
class LineSplitter {
	public:
		explicit LineSplitter(const LineCallback& on_line) : on_line_(on_line) {}

		void Append(const char* data, size_t len) {
			for (size_t i = 0; i < len; ++i) {
				char c = data[i];
				if (c == '\n' || c == '\r') {
					Emit();
				} else {
					pending_.push_back(c);
				}
			}
		}

		void Finish() { Emit(); }

	private:
		void Emit() {
			if (pending_.empty()) return;
			if (on_line_) on_line_(pending_);
			pending_.clear();
		}

		const LineCallback& on_line_;
		std::string pending_;
};

// Reads whatever is available without blocking. Returns false once the pipe hit EOF
// or failed for good.
bool DrainOutput(int fd, LineSplitter& splitter) {
	char buf[4096];
	while (true) {
		ssize_t n = ::read(fd, buf, sizeof(buf));
		if (n > 0) {
			splitter.Append(buf, static_cast<size_t>(n));
			continue;
		}
		if (n == 0) return false;
		if (errno == EINTR) continue;
		if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
		LOG(WARNING) << "Reading command output failed: " << strerror(errno);
		return false;
	}
}

CommandResult SpawnFailure(const std::string& program, const std::string& why) {
	CommandResult result;
	result.status = CommandResult::Status::kSpawnFailed;
	result.error = "failed to execute " + program + ": " + why;
	return result;
}

} // namespace

ProcessRunner::ProcessRunner(int kill_grace_ms, int poll_interval_ms)
	: kill_grace_ms_(std::max(0, kill_grace_ms)),
	  poll_interval_ms_(std::max(1, poll_interval_ms)) {}

CommandResult ProcessRunner::Run(const std::vector<std::string>& argv, const RunOptions& options) {
	if (argv.empty()) {
		return SpawnFailure("<empty>", "no program given");
	}

	// Everything the child touches is prepared before fork.
	std::vector<char*> c_argv;
	c_argv.reserve(argv.size() + 1);
	for (const auto& arg : argv) {
		c_argv.push_back(const_cast<char*>(arg.c_str()));
	}
	c_argv.push_back(nullptr);

	ScopedFd dev_null(::open("/dev/null", O_RDWR | O_CLOEXEC));
	if (!dev_null.valid()) {
		return SpawnFailure(argv[0], std::string("open /dev/null: ") + strerror(errno));
	}

	ScopedFd out_read, out_write;
	if (options.capture_output && !MakePipe(out_read, out_write)) {
		return SpawnFailure(argv[0], std::string("pipe: ") + strerror(errno));
	}

	// Closed by exec on success; carries errno back if exec fails.
	ScopedFd exec_read, exec_write;
	if (!MakePipe(exec_read, exec_write)) {
		return SpawnFailure(argv[0], std::string("pipe: ") + strerror(errno));
	}

	VLOG(1) << "Executing: " << JoinArgs(argv);

	pid_t pid = ::fork();
	if (pid < 0) {
		return SpawnFailure(argv[0], std::string("fork: ") + strerror(errno));
	}

	if (pid == 0) {
		// Child: async-signal-safe calls only.
		if (options.own_process_group) {
			::setpgid(0, 0);
		}
		sigset_t empty;
		sigemptyset(&empty);
		::sigprocmask(SIG_SETMASK, &empty, nullptr);
		::signal(SIGPIPE, SIG_DFL);

		int out_fd = options.capture_output ? out_write.get() : dev_null.get();
		::dup2(dev_null.get(), STDIN_FILENO);
		::dup2(out_fd, STDOUT_FILENO);
		::dup2(out_fd, STDERR_FILENO);

		::execvp(c_argv[0], c_argv.data());

		int err = errno;
		ssize_t ignored = ::write(exec_write.get(), &err, sizeof(err));
		(void)ignored;
		::_exit(127);
	}

	// Parent. Also set the group here so kill(-pid) works even if the child has not run yet.
	if (options.own_process_group) {
		::setpgid(pid, pid);
	}
	// Without a group of its own the child shares ours; signal the child alone.
	const pid_t signal_target = options.own_process_group ? -pid : pid;
	out_write.reset();
	exec_write.reset();

	int child_errno = 0;
	ssize_t n;
	do {
		n = ::read(exec_read.get(), &child_errno, sizeof(child_errno));
	} while (n < 0 && errno == EINTR);
	if (n == static_cast<ssize_t>(sizeof(child_errno))) {
		int ignored_status;
		while (::waitpid(pid, &ignored_status, 0) < 0 && errno == EINTR) {}
		return SpawnFailure(argv[0], strerror(child_errno));
	}

	LineSplitter splitter(options.on_line);
	bool reading = options.capture_output;
	if (reading) {
		int flags = ::fcntl(out_read.get(), F_GETFL);
		::fcntl(out_read.get(), F_SETFL, flags | O_NONBLOCK);
	}

	bool term_sent = false;
	bool kill_sent = false;
	int stop_signal = 0;
	std::chrono::steady_clock::time_point kill_deadline;
	int status = 0;

	while (true) {
		if (reading) {
			struct pollfd pfd = {out_read.get(), POLLIN, 0};
			int ready = ::poll(&pfd, 1, poll_interval_ms_);
			if (ready < 0 && errno != EINTR) {
				LOG(WARNING) << "poll on command output failed: " << strerror(errno);
				reading = false;
			} else if (ready > 0) {
				reading = DrainOutput(out_read.get(), splitter);
			}
		} else if (options.cancel) {
			options.cancel->WaitFor(absl::Milliseconds(std::min(poll_interval_ms_, 20)));
		} else {
			std::this_thread::sleep_for(std::chrono::milliseconds(std::min(poll_interval_ms_, 20)));
		}

		pid_t waited = ::waitpid(pid, &status, WNOHANG | WUNTRACED);
		if (waited == pid && WIFSTOPPED(status)) {
			// A background group touching the terminal (SIGTTIN/SIGTTOU) never resumes.
			stop_signal = WSTOPSIG(status);
			LOG(ERROR) << argv[0] << " (pid " << pid << ") stopped by " << strsignal(stop_signal)
			           << " waiting for terminal input, killing it";
			::kill(signal_target, SIGKILL);
			kill_sent = true;
			continue;
		}
		if (waited == pid) {
			// Descendants may still hold the pipe open; take what is there and stop.
			if (reading) DrainOutput(out_read.get(), splitter);
			break;
		}
		if (waited < 0 && errno != EINTR) {
			CommandResult result = SpawnFailure(argv[0], std::string("waitpid: ") + strerror(errno));
			splitter.Finish();
			return result;
		}

		if (options.cancel && options.cancel->IsCancelled()) {
			auto now = std::chrono::steady_clock::now();
			if (!term_sent) {
				LOG(INFO) << "Cancelling " << argv[0] << " (pid " << pid << ")";
				::kill(signal_target, SIGTERM);
				term_sent = true;
				kill_deadline = now + std::chrono::milliseconds(kill_grace_ms_);
			} else if (!kill_sent && now >= kill_deadline) {
				LOG(WARNING) << argv[0] << " (pid " << pid << ") ignored SIGTERM for "
				             << kill_grace_ms_ << " ms, sending SIGKILL";
				::kill(signal_target, SIGKILL);
				kill_sent = true;
			}
		}
	}
	splitter.Finish();

	CommandResult result;
	if (WIFEXITED(status)) {
		result.exit_code = WEXITSTATUS(status);
	} else if (WIFSIGNALED(status)) {
		result.term_signal = WTERMSIG(status);
	}

	if (term_sent) {
		result.status = CommandResult::Status::kCancelled;
		result.error = "cancelled";
	} else if (WIFEXITED(status)) {
		result.status = CommandResult::Status::kExited;
	} else if (stop_signal != 0) {
		result.status = CommandResult::Status::kSignaled;
		result.error = std::string("stopped by ") + strsignal(stop_signal) +
				" waiting for terminal input";
	} else {
		result.status = CommandResult::Status::kSignaled;
		result.error = std::string("terminated by signal ") + strsignal(result.term_signal);
	}
	return result;
}

} // namespace Prsync
