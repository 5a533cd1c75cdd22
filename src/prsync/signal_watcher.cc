#include "signal_watcher.h"

#include <cerrno>
#include <cstring>
#include <ctime>

#include <pthread.h>

#include <glog/logging.h>

namespace Prsync {

namespace {
constexpr long kWakeupNanos = 100L * 1000 * 1000;
}

SignalWatcher::SignalWatcher(CancellationToken& token) : token_(token) {
	sigemptyset(&watched_);
	sigaddset(&watched_, SIGINT);
	sigaddset(&watched_, SIGTERM);
	int rc = pthread_sigmask(SIG_BLOCK, &watched_, &previous_);
	if (rc != 0) {
		LOG(ERROR) << "Could not block termination signals: " << strerror(rc);
	}
	thread_ = std::thread(&SignalWatcher::Watch, this);
}

SignalWatcher::~SignalWatcher() {
	stop_.store(true);
	if (thread_.joinable()) {
		thread_.join();
	}
	pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

void SignalWatcher::Watch() {
	const struct timespec timeout = {0, kWakeupNanos};
	while (!stop_.load()) {
		int sig = sigtimedwait(&watched_, nullptr, &timeout);
		if (sig < 0) {
			if (errno != EAGAIN && errno != EINTR) {
				LOG(ERROR) << "sigtimedwait failed: " << strerror(errno);
				return;
			}
			continue;
		}
		last_signal_.store(sig);
		if (token_.IsCancelled()) {
			LOG(WARNING) << "Received " << strsignal(sig) << " again, already shutting down";
		} else {
			LOG(WARNING) << "Received " << strsignal(sig) << ", cancelling running transfers";
			token_.Cancel();
		}
	}
}

} // namespace Prsync
