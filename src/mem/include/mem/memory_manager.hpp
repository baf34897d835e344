#pragma once
#include "core/expected.hpp"
#include "core/system_memory.hpp"
#include "mem/cleanup_scheduler.hpp"
#include "mem/memory_config.hpp"
#include "mem/memory_events.hpp"
#include "mem/memory_pool.hpp"
#include "mem/memory_snapshot.hpp"
#include "mem/memory_types.hpp"
#include "mem/usage_monitor.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vmm::mem {

enum class HistoryOp { Allocate, Deallocate, Evict };

const char* history_op_name(HistoryOp op) noexcept;

struct AllocationRecord {
    Clock::time_point at{};
    HistoryOp op = HistoryOp::Allocate;
    std::string pool;
    BlockId block_id = kInvalidBlockId;
    uint64_t size = 0;
};

struct EvictionResult {
    bool satisfied = false;
    uint64_t freed_bytes = 0;
    size_t blocks_evicted = 0;
};

/**
 * @brief Arbitrates a finite memory budget across the video workload pools
 *
 * Owns the pool registry, the allocation engine, the eviction policy and the
 * two background passes (usage monitor, cleanup scheduler). Every structural
 * change and every read of block state runs under one recursive mutex, so
 * eviction may re-enter deallocate. Events raised inside the critical section
 * are queued and delivered once the outermost lock is released, so
 * subscribers may call any manager operation, including stop_monitoring().
 *
 * Capacity pressure (PoolExhausted, GlobalLimitExceeded) is reported through
 * the returned expected plus an event, never by throwing.
 */
class MemoryManager {
public:
    /**
     * @brief Holds the registry lock across several calls
     *
     * Re-entrant. Events raised while any RegistryLock is held are delivered
     * when the outermost one is destroyed, after the mutex is released.
     */
    class RegistryLock {
    public:
        explicit RegistryLock(const MemoryManager& manager);
        ~RegistryLock();

        RegistryLock(const RegistryLock&) = delete;
        RegistryLock& operator=(const RegistryLock&) = delete;

    private:
        const MemoryManager& manager_;
    };

    /**
     * @brief Build the registry from config
     * @param config Pools, limits and thresholds; must pass validate_config()
     * @param probe Process/system memory source, platform probe when null
     * @throws std::invalid_argument if config is invalid
     */
    explicit MemoryManager(MemoryManagerConfig config = default_memory_config(),
                           std::shared_ptr<vmm::core::SystemMemoryProbe> probe = nullptr);

    /**
     * @brief Stops background passes and releases every block
     */
    ~MemoryManager();

    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    /**
     * @brief Stop monitoring (joining both background threads), release all
     * blocks and drain deferred payload releases. Idempotent.
     *
     * Refused (logged, no effect) while the calling thread holds a RegistryLock.
     */
    void shutdown();
    bool is_shut_down() const { return shut_down_.load(); }

    // --- Allocation engine -------------------------------------------------

    /**
     * @brief Track a new block in a pool, evicting as needed
     * @param pool_name Registry pool
     * @param size Bytes charged to the pool, > 0
     * @param payload Owned data, may be null
     * @return Block id, or PoolNotFound / InvalidSize / PoolExhausted /
     *         GlobalLimitExceeded / ShutDown
     */
    [[nodiscard]] expected<BlockId, MemoryError> allocate(const std::string& pool_name, uint64_t size,
                                                          PayloadPtr payload = nullptr,
                                                          Priority priority = Priority::Medium,
                                                          std::string description = {},
                                                          std::set<std::string> tags = {});

    /**
     * @brief Remove a block from accounting and release its payload
     * @return false if the id is unknown (already gone is not an error)
     */
    bool deallocate(BlockId id);

    /**
     * @brief Record an access and hand out the payload without copying
     * @return nullopt for unknown ids; the contained pointer is null for payload-less blocks
     */
    std::optional<PayloadPtr> touch(BlockId id);

    // Metadata copy without counting as an access.
    std::optional<BlockInfo> block_info(BlockId id) const;
    bool contains(BlockId id) const;

    // --- Eviction ----------------------------------------------------------

    /**
     * @brief Evict non-Critical blocks of one pool until required bytes are freed
     *
     * Best effort: evicts what it selected even when the pool cannot cover
     * the full amount; satisfied reports whether it did.
     */
    EvictionResult evict_from_pool(const std::string& pool_name, uint64_t required);

    /**
     * @brief Walk the globally evictable pools by rank, taking at most the
     * configured fraction of each pool's usage, until required bytes are freed
     */
    EvictionResult evict_global(uint64_t required);

    // --- Registry ----------------------------------------------------------

    /**
     * @brief Change a pool's capacity, evicting first when shrinking below usage
     * @return Bytes evicted to fit; PoolNotFound, or InvalidResize when only
     *         Critical blocks would have to go (pool left untouched)
     */
    expected<uint64_t, MemoryError> resize_pool(const std::string& pool_name, uint64_t new_capacity);

    std::vector<std::string> pool_names() const;
    bool has_pool(const std::string& pool_name) const;
    std::vector<std::string> global_eviction_order() const;

    // --- Global budget -----------------------------------------------------

    void set_global_memory_limit(uint64_t limit);
    uint64_t global_memory_limit() const;
    bool set_thresholds(double warning, double critical);
    double warning_threshold() const;
    double critical_threshold() const;

    uint64_t total_used() const;
    uint64_t total_capacity() const;
    uint64_t peak_usage() const;

    // --- Secondary index (external key -> block) ---------------------------

    // Fails for unknown blocks. Rebinding an existing key moves it.
    bool bind_key(const std::string& key, BlockId id);
    std::optional<BlockId> find_by_key(const std::string& key) const;
    bool unbind_key(const std::string& key);

    // --- Housekeeping ------------------------------------------------------

    /**
     * @brief Deallocate blocks carrying tag that were not accessed within max_age
     * @return Number of blocks released
     */
    size_t release_stale_blocks(const std::string& tag, std::chrono::milliseconds max_age);

    /**
     * @brief Make room before a heavy render: trim temporary data and
     * thumbnails to 20% of capacity, preview cache to 40% when above 80%
     * @return Bytes evicted
     */
    uint64_t optimize_for_video_processing();

    /**
     * @brief Release parked payloads nobody references any more
     * @return Number of payloads released
     */
    size_t release_deferred_payloads();
    size_t deferred_payload_count() const;

    // Deallocate every block in every pool and clear histories.
    void release_all();

    // --- Monitoring / cleanup ----------------------------------------------

    void start_monitoring();

    // Joins both tasks. With a RegistryLock held by the caller the tasks are
    // only told to stop; a later stop_monitoring() or shutdown() joins them.
    void stop_monitoring();
    bool monitoring_active() const;

    void set_auto_cleanup_enabled(bool enabled);
    bool auto_cleanup_enabled() const;

    // Synchronous cleanup pass, same as a scheduler tick.
    CleanupReport perform_cleanup(const std::string& trigger = "on_demand");
    std::vector<CleanupReport> cleanup_history() const;

    UsageMonitor& usage_monitor() { return *monitor_; }
    CleanupScheduler& cleanup_scheduler() { return *cleanup_; }

    // --- Stats -------------------------------------------------------------

    MemorySnapshot snapshot() const;
    std::optional<PoolSnapshot> pool_info(const std::string& pool_name) const;
    std::vector<AllocationRecord> allocation_history() const;
    ManagerCounters counters() const;

    // Per-pool ledgers match their blocks and the running total matches the pools.
    bool verify_accounting() const;

    MemoryEventDispatcher& events() { return events_; }
    const MemoryEventDispatcher& events() const { return events_; }

    vmm::core::SystemMemoryProbe& probe() const { return *probe_; }
    const MemoryManagerConfig& config() const { return config_; }

    // True when the calling thread holds the registry lock.
    bool registry_locked_by_caller() const { return lock_owner_.load() == std::this_thread::get_id(); }

private:
    MemoryPool* find_pool(const std::string& name);
    const MemoryPool* find_pool(const std::string& name) const;
    MemoryPool* owner_of(BlockId id);
    const MemoryPool* owner_of(BlockId id) const;

    uint64_t recompute_total() const;
    bool can_cover(const MemoryPool& pool, uint64_t required) const;
    EvictionResult evict_locked(MemoryPool& pool, uint64_t required, const std::string& reason);
    uint64_t trim_to(const std::string& pool_name, double occupancy, const std::string& reason);

    // Removes from accounting, drops index keys, releases (or parks) the payload.
    bool remove_block(BlockId id, HistoryOp op, const std::string& reason);
    void release_payload(const PayloadPtr& payload, BlockId id);
    void record(HistoryOp op, const std::string& pool, BlockId id, uint64_t size);
    void fail_allocation(MemoryError error, const MemoryPool* pool, uint64_t size, uint64_t total);

    // Queue an event for delivery after the registry lock is released.
    void post_event(std::function<void()> event) const;

    static std::atomic<BlockId> next_block_id_;

    MemoryManagerConfig config_;
    std::shared_ptr<vmm::core::SystemMemoryProbe> probe_;

    mutable std::recursive_mutex mutex_;
    mutable size_t lock_depth_ = 0;
    mutable std::atomic<std::thread::id> lock_owner_{std::thread::id()};
    mutable std::vector<std::function<void()>> pending_events_;
    std::vector<std::unique_ptr<MemoryPool>> pools_;
    std::unordered_map<BlockId, MemoryPool*> block_owner_;
    std::unordered_map<std::string, BlockId> key_index_;
    std::unordered_multimap<BlockId, std::string> keys_by_block_;
    std::vector<PayloadPtr> deferred_release_;
    std::deque<AllocationRecord> history_;

    uint64_t total_used_ = 0;
    uint64_t peak_usage_ = 0;
    uint64_t access_sequence_ = 0;
    ManagerCounters counters_;

    MemoryEventDispatcher events_;
    std::unique_ptr<UsageMonitor> monitor_;
    std::unique_ptr<CleanupScheduler> cleanup_;
    std::atomic<bool> shut_down_{false};
};

} // namespace vmm::mem
