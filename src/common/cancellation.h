#ifndef PRSYNC_SRC_COMMON_CANCELLATION_H_
#define PRSYNC_SRC_COMMON_CANCELLATION_H_

#include <atomic>

#include "absl/synchronization/notification.h"
#include "absl/time/time.h"

namespace Prsync {

/**
 * One-shot cancellation signal shared by the scheduler, every worker and the
 * signal watcher. Cancel() may be called any number of times from any thread.
 */
class CancellationToken {
public:
    void Cancel() {
        // Notify() must run exactly once.
        if (!requested_.exchange(true)) {
            notification_.Notify();
        }
    }

    bool IsCancelled() const { return notification_.HasBeenNotified(); }

    // Returns true if cancelled before the timeout expired.
    bool WaitFor(absl::Duration timeout) const {
        return notification_.WaitForNotificationWithTimeout(timeout);
    }

private:
    std::atomic<bool> requested_{false};
    absl::Notification notification_;
};

} // namespace Prsync

#endif // PRSYNC_SRC_COMMON_CANCELLATION_H_
