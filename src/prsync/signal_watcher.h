#ifndef PRSYNC_SIGNAL_WATCHER_H_
#define PRSYNC_SIGNAL_WATCHER_H_

#include <atomic>
#include <csignal>
#include <thread>

#include "common/cancellation.h"

namespace Prsync {

/**
 * Turns SIGINT/SIGTERM into a cancellation request.
 *
 * The constructor blocks both signals in the calling thread, so it must run before any
 * other thread is started; every thread created afterwards inherits the mask. A
 * dedicated thread collects the signals with sigtimedwait() and cancels the token.
 * The previous mask is restored on destruction.
 */
class SignalWatcher {
	public:
		explicit SignalWatcher(CancellationToken& token);
		~SignalWatcher();

		SignalWatcher(const SignalWatcher&) = delete;
		SignalWatcher& operator=(const SignalWatcher&) = delete;

		// Last signal received, 0 if none
		int last_signal() const { return last_signal_.load(); }

	private:
		void Watch();

		CancellationToken& token_;
		sigset_t watched_;
		sigset_t previous_;
		std::atomic<bool> stop_{false};
		std::atomic<int> last_signal_{0};
		std::thread thread_;
};

} // namespace Prsync

#endif // PRSYNC_SIGNAL_WATCHER_H_
