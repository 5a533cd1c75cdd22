#include <gtest/gtest.h>
#include "../../src/scheduler/worker_pool.h"
#include "../../src/scheduler/worker_job.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"

using namespace Prsync;
using namespace std::chrono_literals;

namespace {

std::vector<Bucket> MakeBuckets(int n) {
    std::vector<Bucket> buckets;
    for (int i = 0; i < n; ++i) {
        Bucket bucket;
        bucket.id = i;
        buckets.push_back(bucket);
    }
    return buckets;
}

} // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
    // Records every callback; run succeeds unless run_ is replaced
    SlotCallbacks Recording() {
        SlotCallbacks callbacks;
        callbacks.on_start = [this](const WorkerJob& job) {
            EXPECT_EQ(job.state, JobState::kRunning) << "Bucket " << job.bucket.id;
            absl::MutexLock lock(&mutex_);
            started_.push_back(job.bucket.id);
        };
        callbacks.run = [this](WorkerJob& job) { run_(job); };
        callbacks.on_finish = [this](const WorkerJob& job) {
            EXPECT_TRUE(job.IsTerminal()) << "Bucket " << job.bucket.id;
            absl::MutexLock lock(&mutex_);
            finished_.push_back(job);
        };
        return callbacks;
    }

    std::vector<int> StartedIds() {
        absl::MutexLock lock(&mutex_);
        return started_;
    }

    std::function<void(WorkerJob&)> run_ = [](WorkerJob& job) { job.state = JobState::kSucceeded; };
    CancellationToken cancel_;
    absl::Mutex mutex_;
    std::vector<int> started_;
    std::vector<WorkerJob> finished_;
};

// Test 1: One slot takes buckets strictly in list order
TEST_F(WorkerPoolTest, SingleSlotKeepsListOrder) {
    WorkerPool pool(1, cancel_);
    pool.Drain(MakeBuckets(5), Recording());

    EXPECT_EQ(StartedIds(), (std::vector<int>{0, 1, 2, 3, 4}));
    ASSERT_EQ(finished_.size(), 5u);
    for (const auto& job : finished_) {
        EXPECT_EQ(job.state, JobState::kSucceeded);
        EXPECT_LE(job.started_at, job.finished_at);
    }
}

// Test 2: No more than num_slots jobs run at once, and every slot is used
TEST_F(WorkerPoolTest, RunningJobsAreBoundedBySlots) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    run_ = [&running, &peak](WorkerJob& job) {
        int now = ++running;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(20ms);
        --running;
        job.state = JobState::kSucceeded;
    };

    WorkerPool pool(3, cancel_);
    pool.Drain(MakeBuckets(12), Recording());

    EXPECT_EQ(finished_.size(), 12u);
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 2) << "Slots should overlap";
}

// Test 3: After cancellation remaining buckets fail without being run
TEST_F(WorkerPoolTest, CancelledBucketsAreNeverRun) {
    std::atomic<int> runs{0};
    run_ = [this, &runs](WorkerJob& job) {
        runs++;
        cancel_.Cancel();
        job.state = JobState::kSucceeded;
    };

    WorkerPool pool(1, cancel_);
    pool.Drain(MakeBuckets(4), Recording());

    EXPECT_EQ(runs, 1);
    EXPECT_EQ(StartedIds(), std::vector<int>{0});
    ASSERT_EQ(finished_.size(), 4u);
    for (size_t i = 1; i < finished_.size(); ++i) {
        EXPECT_EQ(finished_[i].state, JobState::kFailed);
        EXPECT_EQ(finished_[i].exit_info.reason, FailureReason::kCancelled);
    }
}

// Test 4: A throwing run fails only its own bucket
TEST_F(WorkerPoolTest, ThrowingRunIsSpawnError) {
    run_ = [](WorkerJob& job) {
        if (job.bucket.id == 1) throw std::runtime_error("cannot write file list");
        job.state = JobState::kSucceeded;
    };

    WorkerPool pool(2, cancel_);
    pool.Drain(MakeBuckets(3), Recording());

    ASSERT_EQ(finished_.size(), 3u);
    auto failed = std::find_if(finished_.begin(), finished_.end(),
                               [](const WorkerJob& job) { return job.bucket.id == 1; });
    ASSERT_NE(failed, finished_.end());
    EXPECT_EQ(failed->state, JobState::kFailed);
    EXPECT_EQ(failed->exit_info.reason, FailureReason::kSpawnError);
    EXPECT_EQ(failed->exit_info.message, "cannot write file list");
}

TEST_F(WorkerPoolTest, RunWithoutOutcomeIsFailed) {
    run_ = [](WorkerJob&) {};

    WorkerPool pool(1, cancel_);
    pool.Drain(MakeBuckets(1), Recording());

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, JobState::kFailed);
    EXPECT_EQ(finished_[0].exit_info.reason, FailureReason::kTransferError);
}

TEST_F(WorkerPoolTest, FinishCallbackErrorReachesCaller) {
    SlotCallbacks callbacks = Recording();
    callbacks.on_finish = [](const WorkerJob&) { throw std::logic_error("aggregator broke"); };

    WorkerPool pool(2, cancel_);
    EXPECT_THROW(pool.Drain(MakeBuckets(6), callbacks), std::logic_error);
}

TEST_F(WorkerPoolTest, EmptyListReturnsImmediately) {
    WorkerPool pool(4, cancel_);
    EXPECT_EQ(pool.num_slots(), 4u);
    pool.Drain({}, Recording());
    EXPECT_TRUE(StartedIds().empty());
    EXPECT_TRUE(finished_.empty());
}

TEST(WorkerJobTest, StateNames) {
    EXPECT_STREQ(ToString(JobState::kPending), "Pending");
    EXPECT_STREQ(ToString(JobState::kSucceeded), "Succeeded");
    EXPECT_STREQ(ToString(FailureReason::kTransferError), "TransferError");
    EXPECT_STREQ(ToString(FailureReason::kCancelled), "Cancelled");

    WorkerJob job(Bucket{});
    EXPECT_FALSE(job.IsTerminal());
    MarkFailed(job, FailureReason::kSpawnError, "no rsync");
    EXPECT_TRUE(job.IsTerminal());
    EXPECT_EQ(job.exit_info.reason, FailureReason::kSpawnError);
    EXPECT_EQ(job.exit_info.message, "no rsync");
}
