#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler: fire-and-forget background work on a kcenon
///        thread_system pool, with an idle barrier.

#include "dcc/foundation/engine_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace dcc::foundation {

/// Thread pool for work that runs after an encounter commits (event
/// delivery). Jobs are not tracked individually; callers synchronize with
/// waitIdle().
///
/// A job that throws is logged under LogCategory::Core and counted in
/// failedJobs(); it never takes down the worker.
///
/// Uses PIMPL so kcenon headers do not leak into the public API.
///
/// Example:
/// @code
///   JobScheduler scheduler(2, "dcc_events");
///   if (auto posted = scheduler.post([] { deliverPending(); }); !posted) {
///       deliverPending();  // run inline instead
///   }
///   scheduler.waitIdle();
/// @endcode
class JobScheduler {
public:
    using JobFunc = std::function<void()>;

    /// @param numThreads  Worker count, at least one.
    /// @param name        Pool name shown in thread_system diagnostics.
    explicit JobScheduler(std::size_t numThreads = 1, std::string name = "dcc_jobs");

    /// Runs shutdown().
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /// Queue a job.
    /// @return SchedulerStopped after shutdown(), JobScheduleFailed if the
    ///         pool rejects the job.
    EngineResult<void> post(JobFunc job);

    /// Block until every posted job has finished. Must not be called from
    /// inside a job.
    void waitIdle();

    /// Finish queued jobs, then stop the workers. Later posts fail.
    void shutdown();

    /// Jobs posted but not yet finished.
    [[nodiscard]] std::size_t inFlight() const;

    [[nodiscard]] uint64_t failedJobs() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dcc::foundation
