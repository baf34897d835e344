#pragma once
#include "core/system_memory.hpp"
#include "mem/memory_types.hpp"
#include "mem/periodic_task.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vmm::mem {

class MemoryManager;

struct PoolCleanup {
    std::string pool;
    uint64_t freed_bytes = 0;
    size_t blocks_freed = 0;
};

struct CleanupReport {
    Clock::time_point started_at{};
    std::string trigger;                 // "auto_cleanup", "on_demand", ...
    uint64_t memory_before = 0;          // process resident bytes
    uint64_t memory_after = 0;
    uint64_t managed_before = 0;         // bytes tracked by the manager
    uint64_t managed_after = 0;
    std::vector<PoolCleanup> pools_cleaned;
    size_t blocks_freed = 0;
    size_t deferred_released = 0;
    std::chrono::microseconds duration{0};

    uint64_t managed_freed() const { return managed_before > managed_after ? managed_before - managed_after : 0; }
};

/**
 * @brief Periodic and on-demand reclamation pass
 *
 * For every pool above the cleanup trigger occupancy, evicts down to the
 * target occupancy, then runs a deferred payload release pass. Each pass is
 * recorded in a bounded history.
 */
class CleanupScheduler {
public:
    CleanupScheduler(MemoryManager& manager, std::shared_ptr<vmm::core::SystemMemoryProbe> probe,
                     size_t history_capacity);
    ~CleanupScheduler();

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    bool start(std::chrono::milliseconds interval);
    void stop();
    void request_stop() { task_.request_stop(); }
    bool running() const { return task_.running(); }
    uint64_t tick_count() const { return task_.tick_count(); }

    CleanupReport run_now(const std::string& trigger = "on_demand");

    std::vector<CleanupReport> history() const;
    void clear_history();

private:
    MemoryManager& manager_;
    std::shared_ptr<vmm::core::SystemMemoryProbe> probe_;
    size_t history_capacity_;
    mutable std::mutex history_mutex_;
    std::deque<CleanupReport> history_;
    PeriodicTask task_;
};

} // namespace vmm::mem
