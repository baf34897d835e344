#include "mem/memory_events.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <exception>

namespace vmm::mem {

MemoryEventDispatcher::SubscriptionId MemoryEventDispatcher::subscribe(MemoryEventCallbacks callbacks) {
    std::scoped_lock lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.push_back(Subscriber{id, std::move(callbacks)});
    return id;
}

bool MemoryEventDispatcher::unsubscribe(SubscriptionId id) {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const Subscriber& s) { return s.id == id; });
    if (it == subscribers_.end()) return false;
    subscribers_.erase(it);
    return true;
}

size_t MemoryEventDispatcher::subscriber_count() const {
    std::scoped_lock lock(mutex_);
    return subscribers_.size();
}

template <typename Fn>
void MemoryEventDispatcher::for_each(const char* event, Fn&& fn) const {
    // Copy so a callback may (un)subscribe without deadlocking
    std::vector<Subscriber> targets;
    {
        std::scoped_lock lock(mutex_);
        targets = subscribers_;
    }
    for (const auto& subscriber : targets) {
        try {
            fn(subscriber.callbacks);
        } catch (const std::exception& e) {
            vmm::log::error(std::string("Exception in ") + event + " subscriber: " + e.what());
        }
    }
}

void MemoryEventDispatcher::memory_warning(const std::string& kind, uint64_t current, uint64_t threshold) const {
    for_each("memory_warning", [&](const MemoryEventCallbacks& cb) {
        if (cb.memory_warning) cb.memory_warning(kind, current, threshold);
    });
}

void MemoryEventDispatcher::pool_overflow(const std::string& pool, uint64_t used, uint64_t capacity) const {
    for_each("pool_overflow", [&](const MemoryEventCallbacks& cb) {
        if (cb.pool_overflow) cb.pool_overflow(pool, used, capacity);
    });
}

void MemoryEventDispatcher::memory_freed(uint64_t size, const std::string& reason) const {
    for_each("memory_freed", [&](const MemoryEventCallbacks& cb) {
        if (cb.memory_freed) cb.memory_freed(size, reason);
    });
}

void MemoryEventDispatcher::allocation_failed(const std::string& reason, uint64_t requested_size) const {
    for_each("allocation_failed", [&](const MemoryEventCallbacks& cb) {
        if (cb.allocation_failed) cb.allocation_failed(reason, requested_size);
    });
}

} // namespace vmm::mem
