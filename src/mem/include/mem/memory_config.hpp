#pragma once
#include "mem/memory_types.hpp"
#include "core/result.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace vmm::mem {

/**
 * @brief Static description of one registry pool
 */
struct PoolConfig {
    std::string name;
    uint64_t capacity = 0;
    bool globally_evictable = false;  // participates in cross-pool eviction
    int eviction_rank = 0;            // lower rank is reclaimed first during global eviction
};

/**
 * @brief Manager-wide configuration
 *
 * Defaults reproduce the stock registry: video frames 2 GiB, preview cache
 * 1 GiB, effects scratch 1 GiB, AI models 2 GiB, temporary data 512 MiB,
 * thumbnails 256 MiB, 8 GiB global ceiling.
 */
struct MemoryManagerConfig {
    std::vector<PoolConfig> pools;

    uint64_t global_memory_limit = 8 * units::GiB;
    double warning_threshold = 0.8;              // fraction of system RAM (process) / global limit
    double critical_threshold = 0.95;
    double pool_overflow_ratio = 0.9;            // monitor alert above this pool occupancy
    double cleanup_trigger_ratio = 0.7;          // cleanup touches pools above this occupancy
    double cleanup_target_ratio = 0.5;           // ... and brings them down to this
    double global_eviction_fraction = 0.5;       // share of a pool's usage one global pass may take

    std::chrono::milliseconds monitor_interval{5000};
    std::chrono::milliseconds cleanup_interval{60000};
    bool auto_cleanup_enabled = true;

    size_t allocation_history_capacity = 1000;
    size_t cleanup_history_capacity = 100;
};

MemoryManagerConfig default_memory_config();

// Checks names, capacities, thresholds and intervals.
vmm::core::VoidResult validate_config(const MemoryManagerConfig& config);

// Pool entry by name, nullptr if absent.
PoolConfig* find_pool_config(MemoryManagerConfig& config, const std::string& name);

} // namespace vmm::mem
