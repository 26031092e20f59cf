#pragma once

/// @file event_dispatcher.hpp
/// @brief EventDispatcher: ordered post-commit delivery of encounter
///        events to subscribers.
///
/// Encounters enqueue events while holding their lock (no I/O, no
/// callbacks) and call flush() after releasing it. Delivery happens either
/// inline on the flushing thread or on a JobScheduler worker. Events reach
/// subscribers in enqueue order.

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>

#include "dcc/foundation/job_scheduler.hpp"
#include "dcc/foundation/signal.hpp"
#include "dcc/service/combat_events.hpp"

namespace dcc::service {

struct DispatchOptions {
    bool async = false;          ///< Deliver on worker threads.
    std::size_t workerThreads = 1;
};

class EventDispatcher {
public:
    using Handler = std::function<void(const EncounterEvent&)>;
    using SubscriptionId = foundation::Signal<const EncounterEvent&>::SlotId;

    explicit EventDispatcher(DispatchOptions options = {});

    /// Waits for outstanding deliveries.
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /// Register a subscriber. Exceptions it throws are logged and dropped.
    SubscriptionId subscribe(Handler handler);

    void unsubscribe(SubscriptionId id);

    /// Append an event to the outbox. Called inside an encounter's
    /// critical section; never invokes subscribers.
    void enqueue(EncounterEvent event);

    /// Deliver everything in the outbox (inline) or schedule delivery
    /// (async). Called after the encounter lock is released.
    void flush();

    /// Block until every event enqueued so far has been delivered.
    void waitIdle();

    [[nodiscard]] bool isAsync() const noexcept { return scheduler_ != nullptr; }
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] uint64_t deliveredCount() const noexcept {
        return delivered_.load(std::memory_order_acquire);
    }

private:
    /// Drain the outbox. Only one thread drains at a time; a caller that
    /// finds a drain in progress leaves its events to that drainer.
    void drain();

    foundation::Signal<const EncounterEvent&> subscribers_;
    std::unique_ptr<foundation::JobScheduler> scheduler_;

    mutable std::mutex queueMutex_;
    std::deque<EncounterEvent> outbox_;

    std::atomic<bool> draining_{false};
    std::atomic<uint64_t> delivered_{0};
};

}  // namespace dcc::service
