#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used as the event subscriber hook.
///
/// Slots are registered with connect() and invoked by emit(). Emission
/// snapshots the slot table under a shared lock and calls the slots with no
/// lock held, so a slot may connect or disconnect without deadlocking.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace dcc::foundation {

/// Observer list dispatching to registered callbacks.
///
/// Slots run in connection order.
///
/// Example:
/// @code
///   Signal<const EncounterEvent&> changed;
///   auto id = changed.connect([](const EncounterEvent& e) { broadcast(e); });
///   changed.emit(event);
///   changed.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback. Returns an id for disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// Remove a callback. Unknown ids are ignored.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

    /// Invoke every registered slot with the given arguments.
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    // Ordered by id so slots fire in connection order.
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace dcc::foundation
