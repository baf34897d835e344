#include "mem/usage_monitor.hpp"
#include "mem/memory_manager.hpp"
#include "core/log.hpp"

namespace vmm::mem {

UsageMonitor::UsageMonitor(MemoryManager& manager, std::shared_ptr<vmm::core::SystemMemoryProbe> probe)
    : manager_(manager)
    , probe_(std::move(probe))
    , task_("UsageMonitor", [this] { sample_once(); }) {}

UsageMonitor::~UsageMonitor() { stop(); }

bool UsageMonitor::start(std::chrono::milliseconds interval) {
    return task_.start(interval);
}

void UsageMonitor::stop() {
    task_.stop();
}

MonitorSample UsageMonitor::sample_once() {
    MonitorSample sample;
    sample.taken_at = Clock::now();
    sample.process_resident = probe_->process_resident_bytes();
    sample.system_total = probe_->total_physical_bytes();

    const MemorySnapshot snap = manager_.snapshot();
    const auto& events = manager_.events();

    if (sample.system_total > 0) {
        sample.warning_bytes = static_cast<uint64_t>(snap.warning_threshold * static_cast<double>(sample.system_total));
        sample.critical_bytes = static_cast<uint64_t>(snap.critical_threshold * static_cast<double>(sample.system_total));
        if (sample.process_resident > sample.critical_bytes) {
            sample.process_critical = true;
            sample.process_warning = true;
            vmm::log::error("Process memory " + std::to_string(sample.process_resident / units::MiB) +
                            " MB above critical threshold " + std::to_string(sample.critical_bytes / units::MiB) + " MB");
            events.memory_warning(warnings::kProcessMemoryCritical, sample.process_resident, sample.critical_bytes);
        } else if (sample.process_resident > sample.warning_bytes) {
            sample.process_warning = true;
            vmm::log::warn("Process memory " + std::to_string(sample.process_resident / units::MiB) +
                           " MB above warning threshold " + std::to_string(sample.warning_bytes / units::MiB) + " MB");
            events.memory_warning(warnings::kProcessMemory, sample.process_resident, sample.warning_bytes);
        }
    }

    sample.managed_total = snap.total_used;
    sample.global_limit = snap.global_limit;
    const auto global_warning_bytes = static_cast<uint64_t>(snap.warning_threshold * static_cast<double>(snap.global_limit));
    if (snap.global_limit > 0 && snap.total_used > global_warning_bytes) {
        sample.global_warning = true;
        events.memory_warning(warnings::kGlobalUsage, snap.total_used, global_warning_bytes);
    }

    const double overflow_ratio = manager_.config().pool_overflow_ratio;
    for (const auto& pool : snap.pools) {
        if (pool.capacity > 0 && pool.occupancy() > overflow_ratio) {
            sample.overflowing_pools.push_back(pool.name);
            events.pool_overflow(pool.name, pool.used, pool.capacity);
        }
    }

    {
        std::scoped_lock lock(sample_mutex_);
        last_sample_ = sample;
    }
    return sample;
}

std::optional<MonitorSample> UsageMonitor::last_sample() const {
    std::scoped_lock lock(sample_mutex_);
    return last_sample_;
}

} // namespace vmm::mem
