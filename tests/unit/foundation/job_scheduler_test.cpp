#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "dcc/foundation/error_code.hpp"
#include "dcc/foundation/job_scheduler.hpp"

using namespace dcc::foundation;

TEST(JobSchedulerTest, PostedJobRuns) {
    JobScheduler scheduler(2);
    std::atomic<int> ran{0};
    ASSERT_TRUE(scheduler.post([&] { ran.fetch_add(1); }).hasValue());
    scheduler.waitIdle();
    EXPECT_EQ(ran.load(), 1);
    EXPECT_EQ(scheduler.inFlight(), 0u);
}

TEST(JobSchedulerTest, ZeroThreadsStillRuns) {
    JobScheduler scheduler(0);
    std::atomic<bool> ran{false};
    ASSERT_TRUE(scheduler.post([&] { ran = true; }).hasValue());
    scheduler.waitIdle();
    EXPECT_TRUE(ran.load());
}

TEST(JobSchedulerTest, WaitIdleCoversEveryJob) {
    JobScheduler scheduler(4, "test_pool");
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(scheduler.post([&] {
            std::this_thread::sleep_for(std::chrono::microseconds(50));
            counter.fetch_add(1);
        }).hasValue());
    }
    scheduler.waitIdle();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(scheduler.inFlight(), 0u);
}

TEST(JobSchedulerTest, WaitIdleWithNothingPostedReturns) {
    JobScheduler scheduler(1);
    scheduler.waitIdle();
    EXPECT_EQ(scheduler.inFlight(), 0u);
}

TEST(JobSchedulerTest, ThrowingJobIsCountedAndWorkerSurvives) {
    JobScheduler scheduler(1);
    ASSERT_TRUE(scheduler.post([] { throw std::runtime_error("subscriber blew up"); }).hasValue());
    std::atomic<bool> after{false};
    ASSERT_TRUE(scheduler.post([&] { after = true; }).hasValue());
    scheduler.waitIdle();
    EXPECT_EQ(scheduler.failedJobs(), 1u);
    EXPECT_TRUE(after.load());
}

TEST(JobSchedulerTest, ShutdownFinishesQueuedJobsThenRejects) {
    JobScheduler scheduler(1);
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(scheduler.post([&] { ran.fetch_add(1); }).hasValue());
    }
    scheduler.shutdown();
    EXPECT_EQ(ran.load(), 10);

    auto late = scheduler.post([] {});
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code(), ErrorCode::SchedulerStopped);

    // A second shutdown (and the destructor) is harmless.
    scheduler.shutdown();
}
