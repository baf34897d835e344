#include "mem/cleanup_scheduler.hpp"
#include "mem/memory_manager.hpp"
#include "core/log.hpp"
#include <iomanip>
#include <sstream>

namespace vmm::mem {

CleanupScheduler::CleanupScheduler(MemoryManager& manager, std::shared_ptr<vmm::core::SystemMemoryProbe> probe,
                                   size_t history_capacity)
    : manager_(manager)
    , probe_(std::move(probe))
    , history_capacity_(history_capacity)
    , task_("CleanupScheduler", [this] {
          if (manager_.auto_cleanup_enabled()) run_now("auto_cleanup");
      }) {}

CleanupScheduler::~CleanupScheduler() { stop(); }

bool CleanupScheduler::start(std::chrono::milliseconds interval) {
    return task_.start(interval);
}

void CleanupScheduler::stop() {
    task_.stop();
}

CleanupReport CleanupScheduler::run_now(const std::string& trigger) {
    CleanupReport report;
    report.trigger = trigger;
    report.started_at = Clock::now();
    report.memory_before = probe_->process_resident_bytes();

    const auto& config = manager_.config();
    {
        MemoryManager::RegistryLock lock(manager_);
        report.managed_before = manager_.total_used();

        for (const auto& name : manager_.pool_names()) {
            auto info = manager_.pool_info(name);
            if (!info || info->capacity == 0 || info->occupancy() <= config.cleanup_trigger_ratio) {
                continue;
            }
            const auto target = static_cast<uint64_t>(static_cast<double>(info->capacity) * config.cleanup_target_ratio);
            const uint64_t required = info->used > target ? info->used - target : 0;
            EvictionResult result = manager_.evict_from_pool(name, required);
            if (result.freed_bytes > 0) {
                report.pools_cleaned.push_back(PoolCleanup{name, result.freed_bytes, result.blocks_evicted});
                report.blocks_freed += result.blocks_evicted;
            }
        }

        report.deferred_released = manager_.release_deferred_payloads();
        report.managed_after = manager_.total_used();
    }

    report.memory_after = probe_->process_resident_bytes();
    report.duration = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - report.started_at);

    std::ostringstream msg;
    msg << "Memory cleanup (" << trigger << ") done: freed " << std::fixed << std::setprecision(2)
        << static_cast<double>(report.managed_freed()) / static_cast<double>(units::MiB) << " MB in "
        << report.pools_cleaned.size() << " pools, " << report.blocks_freed << " blocks, "
        << report.deferred_released << " deferred releases, "
        << static_cast<double>(report.duration.count()) / 1000.0 << " ms";
    vmm::log::info(msg.str());

    {
        std::scoped_lock lock(history_mutex_);
        history_.push_back(report);
        while (history_.size() > history_capacity_) history_.pop_front();
    }
    return report;
}

std::vector<CleanupReport> CleanupScheduler::history() const {
    std::scoped_lock lock(history_mutex_);
    return {history_.begin(), history_.end()};
}

void CleanupScheduler::clear_history() {
    std::scoped_lock lock(history_mutex_);
    history_.clear();
}

} // namespace vmm::mem
