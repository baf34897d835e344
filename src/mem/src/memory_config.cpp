#include "mem/memory_config.hpp"
#include <unordered_set>

namespace vmm::mem {

MemoryManagerConfig default_memory_config() {
    MemoryManagerConfig config;
    config.pools = {
        {pools::kVideoFrames, 2 * units::GiB, false, 0},
        {pools::kPreviewCache, 1 * units::GiB, true, 2},
        {pools::kEffectsProcessing, 1 * units::GiB, true, 3},
        {pools::kAiModels, 2 * units::GiB, false, 0},
        {pools::kTempData, 512 * units::MiB, true, 0},
        {pools::kThumbnails, 256 * units::MiB, true, 1},
    };
    return config;
}

static bool is_fraction(double v) { return v > 0.0 && v <= 1.0; }

vmm::core::VoidResult validate_config(const MemoryManagerConfig& config) {
    if (config.pools.empty()) {
        return vmm::core::Fail(std::string("no pools configured"));
    }

    std::unordered_set<std::string> seen;
    for (const auto& pool : config.pools) {
        if (pool.name.empty()) {
            return vmm::core::Fail(std::string("pool with empty name"));
        }
        if (!seen.insert(pool.name).second) {
            return vmm::core::Fail("duplicate pool name '" + pool.name + "'");
        }
        if (pool.capacity == 0) {
            return vmm::core::Fail("pool '" + pool.name + "' has zero capacity");
        }
    }

    if (config.global_memory_limit == 0) {
        return vmm::core::Fail(std::string("global memory limit is zero"));
    }
    if (!is_fraction(config.warning_threshold) || !is_fraction(config.critical_threshold)) {
        return vmm::core::Fail(std::string("thresholds must be in (0, 1]"));
    }
    if (config.warning_threshold > config.critical_threshold) {
        return vmm::core::Fail(std::string("warning threshold above critical threshold"));
    }
    if (!is_fraction(config.pool_overflow_ratio) || !is_fraction(config.cleanup_trigger_ratio) ||
        !is_fraction(config.global_eviction_fraction)) {
        return vmm::core::Fail(std::string("pool ratios must be in (0, 1]"));
    }
    if (config.cleanup_target_ratio < 0.0 || config.cleanup_target_ratio > config.cleanup_trigger_ratio) {
        return vmm::core::Fail(std::string("cleanup target must be between 0 and the cleanup trigger"));
    }
    if (config.monitor_interval.count() <= 0 || config.cleanup_interval.count() <= 0) {
        return vmm::core::Fail(std::string("monitor and cleanup intervals must be positive"));
    }
    return vmm::core::Ok();
}

PoolConfig* find_pool_config(MemoryManagerConfig& config, const std::string& name) {
    for (auto& pool : config.pools) {
        if (pool.name == name) return &pool;
    }
    return nullptr;
}

} // namespace vmm::mem
