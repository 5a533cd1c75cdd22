#include "worker_pool.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iterator>
#include <thread>

#include <glog/logging.h>

namespace Prsync {

WorkerPool::WorkerPool(size_t num_slots, const CancellationToken& cancel)
    : num_slots_(num_slots), cancel_(cancel) {
    CHECK_GT(num_slots, 0u) << "WorkerPool needs at least one slot";
}

void WorkerPool::Drain(std::vector<Bucket> buckets, const SlotCallbacks& callbacks) {
    if (buckets.empty()) {
        return;
    }
    size_t threads = std::min(num_slots_, buckets.size());
    {
        absl::MutexLock lock(&mutex_);
        pending_.assign(std::make_move_iterator(buckets.begin()),
                        std::make_move_iterator(buckets.end()));
        failure_ = nullptr;
    }

    std::vector<std::thread> slots;
    slots.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        slots.emplace_back(&WorkerPool::SlotLoop, this, std::cref(callbacks));
    }
    for (auto& slot : slots) {
        slot.join();
    }

    std::exception_ptr failure;
    {
        absl::MutexLock lock(&mutex_);
        failure = failure_;
        pending_.clear();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

bool WorkerPool::TakeNext(Bucket* bucket) {
    absl::MutexLock lock(&mutex_);
    if (failure_ || pending_.empty()) {
        return false;
    }
    *bucket = std::move(pending_.front());
    pending_.pop_front();
    return true;
}

void WorkerPool::SlotLoop(const SlotCallbacks& callbacks) {
    Bucket bucket;
    while (TakeNext(&bucket)) {
        // The job exists from the moment a slot owns its bucket
        WorkerJob job(std::move(bucket));
        try {
            Process(job, callbacks);
            callbacks.on_finish(job);
        } catch (...) {
            // Stops every slot; Drain rethrows once they are joined
            absl::MutexLock lock(&mutex_);
            if (!failure_) {
                failure_ = std::current_exception();
            }
            return;
        }
    }
}

void WorkerPool::Process(WorkerJob& job, const SlotCallbacks& callbacks) {
    if (cancel_.IsCancelled()) {
        MarkFailed(job, FailureReason::kCancelled, "run cancelled before the bucket started");
        return;
    }

    job.state = JobState::kRunning;
    job.started_at = std::chrono::steady_clock::now();
    callbacks.on_start(job);
    try {
        callbacks.run(job);
    } catch (const std::exception& e) {
        MarkFailed(job, FailureReason::kSpawnError, e.what());
    }
    if (!job.IsTerminal()) {
        LOG(ERROR) << "Bucket " << job.bucket.id << " finished without an outcome";
        MarkFailed(job, FailureReason::kTransferError, "transfer finished without an outcome");
    }
    job.finished_at = std::chrono::steady_clock::now();
}

} // namespace Prsync
