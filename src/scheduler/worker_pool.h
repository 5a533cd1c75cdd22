#ifndef PRSYNC_WORKER_POOL_H_
#define PRSYNC_WORKER_POOL_H_

#include <deque>
#include <exception>
#include <functional>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "bucketer/bucketer.h"
#include "common/cancellation.h"
#include "worker_job.h"

namespace Prsync {

/**
 * What a slot does with each bucket it picks up.
 */
struct SlotCallbacks {
    // The job has just become Running
    std::function<void(const WorkerJob&)> on_start;
    // Drives a Running job to Succeeded or Failed. A throw fails it as SpawnError.
    std::function<void(WorkerJob&)> run;
    // Exactly once per bucket, with the terminal job
    std::function<void(const WorkerJob&)> on_finish;
};

/**
 * Fixed set of transfer slots draining a list of buckets.
 *
 * Each slot thread takes the next bucket in list order, creates its WorkerJob and
 * either moves it Pending -> Running and hands it to `run`, or, once the run is
 * cancelled, fails it as Cancelled without launching anything. At most num_slots
 * jobs are Running at any instant.
 */
class WorkerPool {
public:
    WorkerPool(size_t num_slots, const CancellationToken& cancel);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Blocks until every bucket has been passed to on_finish.
     * @throws whatever on_start or on_finish threw, after all slots have stopped
     */
    void Drain(std::vector<Bucket> buckets, const SlotCallbacks& callbacks);

    size_t num_slots() const { return num_slots_; }

private:
    void SlotLoop(const SlotCallbacks& callbacks);
    bool TakeNext(Bucket* bucket);
    void Process(WorkerJob& job, const SlotCallbacks& callbacks);

    const size_t num_slots_;
    const CancellationToken& cancel_;

    absl::Mutex mutex_;
    std::deque<Bucket> pending_ ABSL_GUARDED_BY(mutex_);
    std::exception_ptr failure_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Prsync

#endif // PRSYNC_WORKER_POOL_H_
