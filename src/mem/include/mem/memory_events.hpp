#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace vmm::mem {

// Event kinds passed as the first argument of memory_warning.
namespace warnings {
inline constexpr const char* kProcessMemory = "process_memory";
inline constexpr const char* kProcessMemoryCritical = "process_memory_critical";
inline constexpr const char* kGlobalUsage = "global_usage";
inline constexpr const char* kGlobalLimit = "global_limit";
} // namespace warnings

/**
 * @brief Subscriber callbacks; any member may be left empty
 */
struct MemoryEventCallbacks {
    std::function<void(const std::string& kind, uint64_t current, uint64_t threshold)> memory_warning;
    std::function<void(const std::string& pool, uint64_t used, uint64_t capacity)> pool_overflow;
    std::function<void(uint64_t size, const std::string& reason)> memory_freed;
    std::function<void(const std::string& reason, uint64_t requested_size)> allocation_failed;
};

/**
 * @brief Fan-out of memory events to any number of subscribers
 *
 * Emission runs on the thread that raised the event. A subscriber that throws
 * is logged and does not stop delivery to the others.
 */
class MemoryEventDispatcher {
public:
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(MemoryEventCallbacks callbacks);
    bool unsubscribe(SubscriptionId id);
    size_t subscriber_count() const;

    void memory_warning(const std::string& kind, uint64_t current, uint64_t threshold) const;
    void pool_overflow(const std::string& pool, uint64_t used, uint64_t capacity) const;
    void memory_freed(uint64_t size, const std::string& reason) const;
    void allocation_failed(const std::string& reason, uint64_t requested_size) const;

private:
    struct Subscriber {
        SubscriptionId id;
        MemoryEventCallbacks callbacks;
    };

    template <typename Fn>
    void for_each(const char* event, Fn&& fn) const;

    mutable std::mutex mutex_;
    std::vector<Subscriber> subscribers_;
    SubscriptionId next_id_ = 1;
};

} // namespace vmm::mem
