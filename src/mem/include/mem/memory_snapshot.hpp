#pragma once
#include "mem/memory_types.hpp"
#include <string>
#include <vector>

namespace vmm::mem {

struct PoolSnapshot {
    std::string name;
    uint64_t capacity = 0;
    uint64_t used = 0;
    size_t block_count = 0;
    PriorityCounts priority_distribution{};
    bool globally_evictable = false;
    int eviction_rank = 0;

    double occupancy() const {
        return capacity > 0 ? static_cast<double>(used) / static_cast<double>(capacity) : 0.0;
    }
    double usage_percent() const { return occupancy() * 100.0; }
};

struct ManagerCounters {
    uint64_t allocations = 0;
    uint64_t deallocations = 0;
    uint64_t evictions = 0;
    uint64_t failed_allocations = 0;
    uint64_t deferred_released = 0;
};

/**
 * @brief Point-in-time copy of the registry, taken under the manager lock
 */
struct MemorySnapshot {
    Clock::time_point taken_at{};
    std::vector<PoolSnapshot> pools;

    uint64_t total_used = 0;        // manager's running total, tracked independently of the pools
    uint64_t total_capacity = 0;
    uint64_t global_limit = 0;
    uint64_t peak_usage = 0;

    uint64_t process_resident = 0;
    uint64_t system_total = 0;
    uint64_t system_available = 0;  // physical memory free for new allocations

    double warning_threshold = 0.0;
    double critical_threshold = 0.0;

    bool monitoring_active = false;
    bool auto_cleanup_enabled = false;
    size_t deferred_payloads = 0;
    ManagerCounters counters;

    double global_usage_ratio() const {
        return global_limit > 0 ? static_cast<double>(total_used) / static_cast<double>(global_limit) : 0.0;
    }
    const PoolSnapshot* find_pool(const std::string& name) const {
        for (const auto& p : pools) if (p.name == name) return &p;
        return nullptr;
    }
};

} // namespace vmm::mem
