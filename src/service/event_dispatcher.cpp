/// @file event_dispatcher.cpp
/// @brief EventDispatcher implementation.

#include "dcc/service/event_dispatcher.hpp"

#include <exception>
#include <string>
#include <thread>

#include "dcc/foundation/engine_logger.hpp"

using dcc::foundation::LogCategory;

namespace dcc::service {

EventDispatcher::EventDispatcher(DispatchOptions options) {
    if (options.async) {
        scheduler_ =
            std::make_unique<foundation::JobScheduler>(options.workerThreads, "dcc_events");
    }
}

EventDispatcher::~EventDispatcher() {
    waitIdle();
}

EventDispatcher::SubscriptionId EventDispatcher::subscribe(Handler handler) {
    return subscribers_.connect([fn = std::move(handler)](const EncounterEvent& event) {
        try {
            fn(event);
        } catch (const std::exception& e) {
            DCC_LOG_ERROR(LogCategory::Event,
                          std::string("subscriber failed on ") +
                              std::string(operationName(event.operation)) + ": " + e.what());
        }
    });
}

void EventDispatcher::unsubscribe(SubscriptionId id) {
    subscribers_.disconnect(id);
}

void EventDispatcher::enqueue(EncounterEvent event) {
    std::lock_guard lock(queueMutex_);
    outbox_.push_back(std::move(event));
}

void EventDispatcher::flush() {
    if (!scheduler_) {
        drain();
        return;
    }

    auto posted = scheduler_->post([this] { drain(); });
    if (!posted) {
        // Deliver on the caller so events are not stranded.
        DCC_LOG_WARN(LogCategory::Event,
                     "async delivery unavailable, delivering inline: " +
                         std::string(posted.error().message()));
        drain();
    }
}

void EventDispatcher::waitIdle() {
    if (scheduler_) {
        scheduler_->waitIdle();
    }

    // Pick up anything enqueued without a flush, or left by a drainer that
    // is still running on another thread.
    drain();
    while (draining_.load(std::memory_order_acquire) || pendingCount() > 0) {
        std::this_thread::yield();
        drain();
    }
}

std::size_t EventDispatcher::pendingCount() const {
    std::lock_guard lock(queueMutex_);
    return outbox_.size();
}

void EventDispatcher::drain() {
    bool expected = false;
    while (draining_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        for (;;) {
            EncounterEvent event;
            {
                std::lock_guard lock(queueMutex_);
                if (outbox_.empty()) {
                    break;
                }
                event = std::move(outbox_.front());
                outbox_.pop_front();
            }
            subscribers_.emit(event);
            delivered_.fetch_add(1, std::memory_order_acq_rel);
        }
        draining_.store(false, std::memory_order_release);

        // An event enqueued while we were finishing would otherwise wait
        // for the next flush.
        if (pendingCount() == 0) {
            return;
        }
        expected = false;
    }
}

}  // namespace dcc::service
