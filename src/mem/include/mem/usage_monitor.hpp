#pragma once
#include "core/system_memory.hpp"
#include "mem/memory_types.hpp"
#include "mem/periodic_task.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vmm::mem {

class MemoryManager;

/**
 * @brief What one monitor tick observed
 */
struct MonitorSample {
    Clock::time_point taken_at{};
    uint64_t process_resident = 0;
    uint64_t system_total = 0;
    uint64_t warning_bytes = 0;   // warning_threshold x system_total
    uint64_t critical_bytes = 0;  // critical_threshold x system_total
    bool process_warning = false;
    bool process_critical = false;
    uint64_t managed_total = 0;
    uint64_t global_limit = 0;
    bool global_warning = false;
    std::vector<std::string> overflowing_pools;
};

/**
 * @brief Read-only poller comparing process and pool usage against thresholds
 *
 * Each tick takes one snapshot of the registry and emits memory_warning /
 * pool_overflow events through the manager's dispatcher. Never mutates pools.
 */
class UsageMonitor {
public:
    UsageMonitor(MemoryManager& manager, std::shared_ptr<vmm::core::SystemMemoryProbe> probe);
    ~UsageMonitor();

    UsageMonitor(const UsageMonitor&) = delete;
    UsageMonitor& operator=(const UsageMonitor&) = delete;

    bool start(std::chrono::milliseconds interval);
    void stop();
    void request_stop() { task_.request_stop(); }
    bool running() const { return task_.running(); }
    uint64_t tick_count() const { return task_.tick_count(); }

    // One tick, synchronously on the calling thread.
    MonitorSample sample_once();
    std::optional<MonitorSample> last_sample() const;

private:
    MemoryManager& manager_;
    std::shared_ptr<vmm::core::SystemMemoryProbe> probe_;
    mutable std::mutex sample_mutex_;
    std::optional<MonitorSample> last_sample_;
    PeriodicTask task_;
};

} // namespace vmm::mem
