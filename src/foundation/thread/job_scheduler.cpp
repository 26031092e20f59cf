/// @file job_scheduler.cpp
/// @brief JobScheduler implementation on kcenon thread_system.

#include "dcc/foundation/job_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <vector>

#include "dcc/foundation/engine_logger.hpp"

namespace dcc::foundation {

struct JobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJob{1};
    std::atomic<uint64_t> failed{0};

    mutable std::mutex mutex;
    std::condition_variable idle;
    std::size_t inFlight = 0;
    bool accepting = true;
    bool poolStopped = false;

    void finished() {
        std::lock_guard lock(mutex);
        if (--inFlight == 0) {
            idle.notify_all();
        }
    }
};

JobScheduler::JobScheduler(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(std::move(name));

    auto count = std::max<std::size_t>(numThreads, 1);
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    shutdown();
}

EngineResult<void> JobScheduler::post(JobFunc job) {
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->accepting) {
            return fail<void>(ErrorCode::SchedulerStopped, "scheduler is shut down");
        }
        ++impl_->inFlight;
    }

    auto* impl = impl_.get();
    auto seq = impl->nextJob.fetch_add(1, std::memory_order_relaxed);
    auto threadJob = kcenon::thread::job_builder()
        .name("dcc_job_" + std::to_string(seq))
        .work([impl, fn = std::move(job)]() -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                impl->failed.fetch_add(1, std::memory_order_relaxed);
                DCC_LOG_ERROR(LogCategory::Core,
                              std::string("background job failed: ") + e.what());
            }
            impl->finished();
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqueued = impl_->pool->enqueue(std::move(threadJob));
    if (enqueued.is_err()) {
        impl_->finished();
        return fail<void>(ErrorCode::JobScheduleFailed, "thread pool rejected job");
    }
    return EngineResult<void>::ok();
}

void JobScheduler::waitIdle() {
    std::unique_lock lock(impl_->mutex);
    impl_->idle.wait(lock, [this] { return impl_->inFlight == 0; });
}

void JobScheduler::shutdown() {
    {
        std::lock_guard lock(impl_->mutex);
        impl_->accepting = false;
    }
    waitIdle();

    std::lock_guard lock(impl_->mutex);
    if (!impl_->poolStopped) {
        impl_->pool->stop(false);
        impl_->poolStopped = true;
    }
}

std::size_t JobScheduler::inFlight() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->inFlight;
}

uint64_t JobScheduler::failedJobs() const noexcept {
    return impl_->failed.load(std::memory_order_relaxed);
}

}  // namespace dcc::foundation
