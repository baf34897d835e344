#include "mem/memory_manager.hpp"
#include "mem/eviction_policy.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace vmm::mem {

std::atomic<BlockId> MemoryManager::next_block_id_{1};

const char* history_op_name(HistoryOp op) noexcept {
    switch (op) {
        case HistoryOp::Allocate: return "allocate";
        case HistoryOp::Deallocate: return "deallocate";
        case HistoryOp::Evict: return "evict";
    }
    return "unknown";
}

namespace {

std::string mb(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / static_cast<double>(units::MiB) << " MB";
    return oss.str();
}

// Bytes by which used + size would pass limit, 0 when it fits. Saturates instead of wrapping.
uint64_t overshoot(uint64_t used, uint64_t size, uint64_t limit) {
    if (used <= limit) {
        return size > limit - used ? size - (limit - used) : 0;
    }
    const uint64_t over = used - limit;
    return size > std::numeric_limits<uint64_t>::max() - over ? std::numeric_limits<uint64_t>::max() : over + size;
}

} // namespace

MemoryManager::RegistryLock::RegistryLock(const MemoryManager& manager) : manager_(manager) {
    manager_.mutex_.lock();
    if (manager_.lock_depth_++ == 0) manager_.lock_owner_.store(std::this_thread::get_id());
}

MemoryManager::RegistryLock::~RegistryLock() {
    std::vector<std::function<void()>> events;
    if (--manager_.lock_depth_ == 0) {
        manager_.lock_owner_.store(std::thread::id());
        events.swap(manager_.pending_events_);
    }
    manager_.mutex_.unlock();
    // Subscribers run with the registry unlocked and may call back into the manager
    for (auto& event : events) event();
}

void MemoryManager::post_event(std::function<void()> event) const {
    pending_events_.push_back(std::move(event));
}

MemoryManager::MemoryManager(MemoryManagerConfig config, std::shared_ptr<vmm::core::SystemMemoryProbe> probe)
    : config_(std::move(config))
    , probe_(probe ? std::move(probe) : vmm::core::make_platform_memory_probe()) {

    auto valid = validate_config(config_);
    if (valid.is_error()) {
        vmm::log::error("Invalid memory manager configuration: " + valid.error());
        throw std::invalid_argument("invalid memory manager configuration: " + valid.error());
    }

    pools_.reserve(config_.pools.size());
    for (const auto& pc : config_.pools) {
        pools_.push_back(std::make_unique<MemoryPool>(pc.name, pc.capacity, pc.globally_evictable, pc.eviction_rank));
    }

    monitor_ = std::make_unique<UsageMonitor>(*this, probe_);
    cleanup_ = std::make_unique<CleanupScheduler>(*this, probe_, config_.cleanup_history_capacity);

    vmm::log::info("MemoryManager created with " + std::to_string(pools_.size()) + " pools, global limit " +
                   mb(config_.global_memory_limit));
}

MemoryManager::~MemoryManager() {
    shutdown();
}

void MemoryManager::shutdown() {
    if (registry_locked_by_caller()) {
        vmm::log::error("MemoryManager shutdown refused: calling thread holds the registry lock");
        return;
    }
    if (shut_down_.exchange(true)) return;

    // Join both background threads before touching the registry
    stop_monitoring();
    release_all();

    RegistryLock lock(*this);
    size_t forced = 0;
    for (auto& payload : deferred_release_) {
        release_payload(payload, kInvalidBlockId);
        ++forced;
    }
    deferred_release_.clear();
    if (forced > 0) {
        vmm::log::debug("Released " + std::to_string(forced) + " still-referenced payloads at shutdown");
    }
    vmm::log::info("MemoryManager shutdown complete, peak usage " + mb(peak_usage_));
}

// --- lookup helpers ---------------------------------------------------------

MemoryPool* MemoryManager::find_pool(const std::string& name) {
    for (auto& pool : pools_) {
        if (pool->name() == name) return pool.get();
    }
    return nullptr;
}

const MemoryPool* MemoryManager::find_pool(const std::string& name) const {
    for (const auto& pool : pools_) {
        if (pool->name() == name) return pool.get();
    }
    return nullptr;
}

MemoryPool* MemoryManager::owner_of(BlockId id) {
    auto it = block_owner_.find(id);
    return it != block_owner_.end() ? it->second : nullptr;
}

const MemoryPool* MemoryManager::owner_of(BlockId id) const {
    auto it = block_owner_.find(id);
    return it != block_owner_.end() ? it->second : nullptr;
}

uint64_t MemoryManager::recompute_total() const {
    uint64_t total = 0;
    for (const auto& pool : pools_) total += pool->used();
    return total;
}

bool MemoryManager::can_cover(const MemoryPool& pool, uint64_t required) const {
    return pool.evictable_bytes() >= required;
}

// --- allocation engine ------------------------------------------------------

void MemoryManager::fail_allocation(MemoryError error, const MemoryPool* pool, uint64_t size, uint64_t total) {
    ++counters_.failed_allocations;
    switch (error) {
        case MemoryError::PoolExhausted:
            vmm::log::warn("Pool " + pool->name() + " exhausted: requested " + mb(size) + ", used " +
                           mb(pool->used()) + " of " + mb(pool->capacity()));
            post_event([this, name = pool->name(), used = pool->used(), capacity = pool->capacity(), size] {
                events_.pool_overflow(name, used, capacity);
                events_.allocation_failed("pool " + name + " exhausted", size);
            });
            break;
        case MemoryError::GlobalLimitExceeded:
            vmm::log::warn("Global memory limit exceeded: requested " + mb(size) + ", total " + mb(total) +
                           " of " + mb(config_.global_memory_limit));
            post_event([this, total, limit = config_.global_memory_limit, size] {
                events_.memory_warning(warnings::kGlobalLimit, total, limit);
                events_.allocation_failed("global memory limit", size);
            });
            break;
        default:
            post_event([this, error, size] { events_.allocation_failed(error_name(error), size); });
            break;
    }
}

expected<BlockId, MemoryError> MemoryManager::allocate(const std::string& pool_name, uint64_t size,
                                                       PayloadPtr payload, Priority priority,
                                                       std::string description, std::set<std::string> tags) {
    RegistryLock lock(*this);

    if (shut_down_) {
        return make_unexpected(MemoryError::ShutDown);
    }

    MemoryPool* pool = find_pool(pool_name);
    if (!pool) {
        vmm::log::error("Unknown memory pool: " + pool_name);
        ++counters_.failed_allocations;
        post_event([this, pool_name, size] { events_.allocation_failed("unknown pool " + pool_name, size); });
        return make_unexpected(MemoryError::PoolNotFound);
    }
    if (size == 0) {
        vmm::log::error("Zero-sized allocation requested in pool " + pool_name);
        fail_allocation(MemoryError::InvalidSize, pool, size, total_used_);
        return make_unexpected(MemoryError::InvalidSize);
    }

    // 1. Pool capacity
    if (const uint64_t shortfall = overshoot(pool->used(), size, pool->capacity()); shortfall > 0) {
        if (size > pool->capacity()) {
            fail_allocation(MemoryError::PoolExhausted, pool, size, total_used_);
            return make_unexpected(MemoryError::PoolExhausted);
        }
        if (!can_cover(*pool, shortfall) ||
            !evict_locked(*pool, shortfall, "making room in " + pool_name).satisfied) {
            fail_allocation(MemoryError::PoolExhausted, pool, size, total_used_);
            return make_unexpected(MemoryError::PoolExhausted);
        }
    }

    // 2. Global ceiling across all pools
    uint64_t total = recompute_total();
    if (const uint64_t excess = overshoot(total, size, config_.global_memory_limit); excess > 0) {
        // A request larger than the limit itself never fits, so nothing is evicted for it
        if (size <= config_.global_memory_limit) {
            evict_global(excess);
            total = recompute_total();
        }
        if (overshoot(total, size, config_.global_memory_limit) > 0) {
            fail_allocation(MemoryError::GlobalLimitExceeded, pool, size, total);
            return make_unexpected(MemoryError::GlobalLimitExceeded);
        }
    }

    // 3. Commit
    const auto now = Clock::now();
    Block block;
    block.id = next_block_id_.fetch_add(1);
    block.size = size;
    block.priority = priority;
    block.payload = std::move(payload);
    block.created_at = now;
    block.last_access_at = now;
    block.access_sequence = ++access_sequence_;
    block.description = std::move(description);
    block.tags = std::move(tags);

    const BlockId id = block.id;
    pool->insert(std::move(block));
    block_owner_[id] = pool;
    total_used_ += size;
    peak_usage_ = std::max(peak_usage_, total_used_);
    ++counters_.allocations;
    record(HistoryOp::Allocate, pool_name, id, size);

    vmm::log::debug("Allocated block " + std::to_string(id) + " in " + pool_name + ", size " + mb(size) +
                    ", priority " + priority_name(priority));
    return id;
}

bool MemoryManager::deallocate(BlockId id) {
    RegistryLock lock(*this);
    if (!remove_block(id, HistoryOp::Deallocate, "deallocate block " + std::to_string(id))) {
        vmm::log::debug("Deallocate ignored, block " + std::to_string(id) + " not found");
        return false;
    }
    return true;
}

bool MemoryManager::remove_block(BlockId id, HistoryOp op, const std::string& reason) {
    MemoryPool* pool = owner_of(id);
    if (!pool) return false;

    std::optional<Block> block = pool->extract(id);
    block_owner_.erase(id);
    if (!block) {
        vmm::log::error("Block index out of sync for block " + std::to_string(id));
        return false;
    }

    total_used_ -= block->size;
    if (op == HistoryOp::Evict) {
        ++counters_.evictions;
    } else {
        ++counters_.deallocations;
    }

    auto range = keys_by_block_.equal_range(id);
    for (auto it = range.first; it != range.second; ++it) {
        key_index_.erase(it->second);
    }
    keys_by_block_.erase(id);

    record(op, pool->name(), id, block->size);

    if (block->payload) {
        // Still referenced by a caller that touched it: release once they let go
        if (block->payload.use_count() > 1) {
            deferred_release_.push_back(std::move(block->payload));
        } else {
            release_payload(block->payload, id);
        }
    }

    post_event([this, size = block->size, reason] { events_.memory_freed(size, reason); });
    VMM_MEM_TRACE("Removed block " + std::to_string(id) + " (" + history_op_name(op) + ") from " + pool->name());
    return true;
}

void MemoryManager::release_payload(const PayloadPtr& payload, BlockId id) {
    auto* releasable = dynamic_cast<Releasable*>(payload.get());
    if (!releasable) return;
    try {
        releasable->release();
    } catch (const std::exception& e) {
        vmm::log::error("Payload release failed for block " + std::to_string(id) + ": " + e.what());
    }
}

std::optional<PayloadPtr> MemoryManager::touch(BlockId id) {
    RegistryLock lock(*this);
    MemoryPool* pool = owner_of(id);
    if (!pool) return std::nullopt;
    Block* block = pool->find(id);
    if (!block) return std::nullopt;
    block->touch(Clock::now(), ++access_sequence_);
    return block->payload;
}

std::optional<BlockInfo> MemoryManager::block_info(BlockId id) const {
    RegistryLock lock(*this);
    const MemoryPool* pool = owner_of(id);
    if (!pool) return std::nullopt;
    const Block* block = pool->find(id);
    if (!block) return std::nullopt;

    BlockInfo info;
    info.id = block->id;
    info.pool = pool->name();
    info.size = block->size;
    info.priority = block->priority;
    info.created_at = block->created_at;
    info.last_access_at = block->last_access_at;
    info.access_count = block->access_count;
    info.description = block->description;
    info.tags = block->tags;
    info.has_payload = static_cast<bool>(block->payload);
    return info;
}

bool MemoryManager::contains(BlockId id) const {
    RegistryLock lock(*this);
    return block_owner_.count(id) != 0;
}

void MemoryManager::record(HistoryOp op, const std::string& pool, BlockId id, uint64_t size) {
    if (config_.allocation_history_capacity == 0) return;
    history_.push_back(AllocationRecord{Clock::now(), op, pool, id, size});
    while (history_.size() > config_.allocation_history_capacity) history_.pop_front();
}

// --- eviction ---------------------------------------------------------------

EvictionResult MemoryManager::evict_locked(MemoryPool& pool, uint64_t required, const std::string& reason) {
    EvictionResult result;
    EvictionPlan plan = EvictionPolicy::plan(pool, required);
    for (BlockId victim : plan.victims) {
        const Block* block = pool.find(victim);
        if (!block) continue;
        const uint64_t size = block->size;
        VMM_EVICT_DEBUG("Evicting block " + std::to_string(victim) + " (" + priority_name(block->priority) +
                        ") from " + pool.name());
        if (remove_block(victim, HistoryOp::Evict, "evicted from " + pool.name() + ": " + reason)) {
            result.freed_bytes += size;
            ++result.blocks_evicted;
        }
    }
    result.satisfied = result.freed_bytes >= required;
    if (result.blocks_evicted > 0) {
        vmm::log::debug("Evicted " + std::to_string(result.blocks_evicted) + " blocks (" + mb(result.freed_bytes) +
                        ") from " + pool.name() + ", required " + mb(required));
    }
    return result;
}

EvictionResult MemoryManager::evict_from_pool(const std::string& pool_name, uint64_t required) {
    RegistryLock lock(*this);
    MemoryPool* pool = find_pool(pool_name);
    if (!pool) {
        vmm::log::error("Unknown memory pool: " + pool_name);
        return {};
    }
    return evict_locked(*pool, required, "explicit eviction");
}

EvictionResult MemoryManager::evict_global(uint64_t required) {
    RegistryLock lock(*this);
    EvictionResult total;
    if (required == 0) {
        total.satisfied = true;
        return total;
    }

    for (const auto& name : global_eviction_order()) {
        if (total.freed_bytes >= required) break;
        MemoryPool* pool = find_pool(name);
        if (!pool || pool->used() == 0) continue;

        const auto share = static_cast<uint64_t>(static_cast<double>(pool->used()) * config_.global_eviction_fraction);
        if (share == 0) continue;
        EvictionResult r = evict_locked(*pool, share, "global limit");
        total.freed_bytes += r.freed_bytes;
        total.blocks_evicted += r.blocks_evicted;
    }
    total.satisfied = total.freed_bytes >= required;
    vmm::log::info("Global eviction freed " + mb(total.freed_bytes) + " of " + mb(required) + " required" +
                   (total.satisfied ? "" : " (insufficient)"));
    return total;
}

// --- registry ---------------------------------------------------------------

expected<uint64_t, MemoryError> MemoryManager::resize_pool(const std::string& pool_name, uint64_t new_capacity) {
    RegistryLock lock(*this);
    MemoryPool* pool = find_pool(pool_name);
    if (!pool) {
        vmm::log::error("Unknown memory pool: " + pool_name);
        return make_unexpected(MemoryError::PoolNotFound);
    }
    if (new_capacity == 0) {
        vmm::log::error("Cannot resize pool " + pool_name + " to zero bytes");
        return make_unexpected(MemoryError::InvalidResize);
    }

    uint64_t evicted = 0;
    if (new_capacity < pool->used()) {
        const uint64_t shortfall = pool->used() - new_capacity;
        if (!can_cover(*pool, shortfall)) {
            vmm::log::error("Cannot shrink pool " + pool_name + " to " + mb(new_capacity) +
                            " without evicting critical blocks");
            return make_unexpected(MemoryError::InvalidResize);
        }
        EvictionResult r = evict_locked(*pool, shortfall, "pool resize");
        evicted = r.freed_bytes;
        if (!r.satisfied) {
            vmm::log::error("Shrinking pool " + pool_name + " freed only " + mb(r.freed_bytes));
            return make_unexpected(MemoryError::InvalidResize);
        }
    }

    pool->set_capacity(new_capacity);
    if (auto* pc = find_pool_config(config_, pool_name)) pc->capacity = new_capacity;
    vmm::log::info("Pool " + pool_name + " capacity set to " + mb(new_capacity));
    return evicted;
}

std::vector<std::string> MemoryManager::pool_names() const {
    RegistryLock lock(*this);
    std::vector<std::string> names;
    names.reserve(pools_.size());
    for (const auto& pool : pools_) names.push_back(pool->name());
    return names;
}

bool MemoryManager::has_pool(const std::string& pool_name) const {
    RegistryLock lock(*this);
    return find_pool(pool_name) != nullptr;
}

std::vector<std::string> MemoryManager::global_eviction_order() const {
    RegistryLock lock(*this);
    std::vector<const MemoryPool*> evictable;
    for (const auto& pool : pools_) {
        if (pool->globally_evictable()) evictable.push_back(pool.get());
    }
    std::stable_sort(evictable.begin(), evictable.end(),
                     [](const MemoryPool* a, const MemoryPool* b) { return a->eviction_rank() < b->eviction_rank(); });
    std::vector<std::string> names;
    names.reserve(evictable.size());
    for (const auto* pool : evictable) names.push_back(pool->name());
    return names;
}

// --- global budget ----------------------------------------------------------

void MemoryManager::set_global_memory_limit(uint64_t limit) {
    RegistryLock lock(*this);
    config_.global_memory_limit = limit;
    vmm::log::info("Global memory limit set to " + mb(limit));
}

uint64_t MemoryManager::global_memory_limit() const {
    RegistryLock lock(*this);
    return config_.global_memory_limit;
}

bool MemoryManager::set_thresholds(double warning, double critical) {
    RegistryLock lock(*this);
    MemoryManagerConfig candidate = config_;
    candidate.warning_threshold = warning;
    candidate.critical_threshold = critical;
    if (auto valid = validate_config(candidate); valid.is_error()) {
        vmm::log::error("Rejected memory thresholds warning=" + std::to_string(warning) +
                        " critical=" + std::to_string(critical) + ": " + valid.error());
        return false;
    }
    config_.warning_threshold = warning;
    config_.critical_threshold = critical;
    return true;
}

double MemoryManager::warning_threshold() const {
    RegistryLock lock(*this);
    return config_.warning_threshold;
}

double MemoryManager::critical_threshold() const {
    RegistryLock lock(*this);
    return config_.critical_threshold;
}

uint64_t MemoryManager::total_used() const {
    RegistryLock lock(*this);
    return total_used_;
}

uint64_t MemoryManager::total_capacity() const {
    RegistryLock lock(*this);
    uint64_t total = 0;
    for (const auto& pool : pools_) total += pool->capacity();
    return total;
}

uint64_t MemoryManager::peak_usage() const {
    RegistryLock lock(*this);
    return peak_usage_;
}

// --- secondary index --------------------------------------------------------

bool MemoryManager::bind_key(const std::string& key, BlockId id) {
    RegistryLock lock(*this);
    if (!owner_of(id)) return false;
    auto existing = key_index_.find(key);
    if (existing != key_index_.end()) {
        if (existing->second == id) return true;
        auto range = keys_by_block_.equal_range(existing->second);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == key) {
                keys_by_block_.erase(it);
                break;
            }
        }
    }
    key_index_[key] = id;
    keys_by_block_.emplace(id, key);
    return true;
}

std::optional<BlockId> MemoryManager::find_by_key(const std::string& key) const {
    RegistryLock lock(*this);
    auto it = key_index_.find(key);
    if (it == key_index_.end()) return std::nullopt;
    return it->second;
}

bool MemoryManager::unbind_key(const std::string& key) {
    RegistryLock lock(*this);
    auto it = key_index_.find(key);
    if (it == key_index_.end()) return false;
    auto range = keys_by_block_.equal_range(it->second);
    for (auto r = range.first; r != range.second; ++r) {
        if (r->second == key) {
            keys_by_block_.erase(r);
            break;
        }
    }
    key_index_.erase(it);
    return true;
}

// --- housekeeping -----------------------------------------------------------

size_t MemoryManager::release_stale_blocks(const std::string& tag, std::chrono::milliseconds max_age) {
    RegistryLock lock(*this);
    const auto now = Clock::now();
    std::vector<BlockId> stale;
    for (const auto& pool : pools_) {
        for (const auto& [id, block] : pool->blocks()) {
            if (block.has_tag(tag) && now - block.last_access_at > max_age) {
                stale.push_back(id);
            }
        }
    }
    size_t released = 0;
    for (BlockId id : stale) {
        if (remove_block(id, HistoryOp::Deallocate, "stale " + tag)) ++released;
    }
    vmm::log::info("Released " + std::to_string(released) + " stale '" + tag + "' blocks");
    return released;
}

uint64_t MemoryManager::trim_to(const std::string& pool_name, double occupancy, const std::string& reason) {
    MemoryPool* pool = find_pool(pool_name);
    if (!pool) return 0;
    const auto target = static_cast<uint64_t>(static_cast<double>(pool->capacity()) * occupancy);
    if (pool->used() <= target) return 0;
    return evict_locked(*pool, pool->used() - target, reason).freed_bytes;
}

uint64_t MemoryManager::optimize_for_video_processing() {
    RegistryLock lock(*this);
    uint64_t freed = 0;
    freed += trim_to(pools::kTempData, 0.2, "video processing");
    freed += trim_to(pools::kThumbnails, 0.2, "video processing");

    const MemoryPool* preview = find_pool(pools::kPreviewCache);
    if (preview && preview->occupancy() > 0.8) {
        freed += trim_to(pools::kPreviewCache, 0.4, "video processing");
    }
    vmm::log::info("Memory optimized for video processing, freed " + mb(freed));
    return freed;
}

size_t MemoryManager::release_deferred_payloads() {
    RegistryLock lock(*this);
    size_t released = 0;
    auto it = deferred_release_.begin();
    while (it != deferred_release_.end()) {
        if (it->use_count() == 1) {
            release_payload(*it, kInvalidBlockId);
            it = deferred_release_.erase(it);
            ++released;
        } else {
            ++it;
        }
    }
    counters_.deferred_released += released;
    return released;
}

size_t MemoryManager::deferred_payload_count() const {
    RegistryLock lock(*this);
    return deferred_release_.size();
}

void MemoryManager::release_all() {
    RegistryLock lock(*this);
    std::vector<BlockId> ids;
    ids.reserve(block_owner_.size());
    for (const auto& [id, pool] : block_owner_) ids.push_back(id);
    for (BlockId id : ids) {
        remove_block(id, HistoryOp::Deallocate, "release all");
    }
    history_.clear();
    cleanup_->clear_history();
    vmm::log::info("Released all " + std::to_string(ids.size()) + " blocks");
}

// --- monitoring / cleanup ---------------------------------------------------

void MemoryManager::start_monitoring() {
    if (shut_down_) return;
    bool started = monitor_->start(config_.monitor_interval);
    if (auto_cleanup_enabled()) {
        started = cleanup_->start(config_.cleanup_interval) || started;
    }
    if (started) vmm::log::info("Memory monitoring started");
}

void MemoryManager::stop_monitoring() {
    const bool was_active = monitoring_active();
    if (registry_locked_by_caller()) {
        // A tick may be waiting for this lock: joining here would never return
        monitor_->request_stop();
        cleanup_->request_stop();
        if (was_active) vmm::log::info("Memory monitoring stop requested");
        return;
    }
    monitor_->stop();
    cleanup_->stop();
    if (was_active) vmm::log::info("Memory monitoring stopped");
}

bool MemoryManager::monitoring_active() const {
    return monitor_->running() || cleanup_->running();
}

void MemoryManager::set_auto_cleanup_enabled(bool enabled) {
    {
        RegistryLock lock(*this);
        config_.auto_cleanup_enabled = enabled;
    }
    if (!enabled) {
        if (registry_locked_by_caller()) {
            cleanup_->request_stop();
        } else {
            cleanup_->stop();
        }
    } else if (monitor_->running()) {
        cleanup_->start(config_.cleanup_interval);
    }
}

bool MemoryManager::auto_cleanup_enabled() const {
    RegistryLock lock(*this);
    return config_.auto_cleanup_enabled;
}

CleanupReport MemoryManager::perform_cleanup(const std::string& trigger) {
    return cleanup_->run_now(trigger);
}

std::vector<CleanupReport> MemoryManager::cleanup_history() const {
    return cleanup_->history();
}

// --- stats ------------------------------------------------------------------

MemorySnapshot MemoryManager::snapshot() const {
    MemorySnapshot snap;
    const vmm::core::SystemMemoryInfo sys = probe_->query();
    snap.process_resident = sys.process_resident_memory;
    snap.system_total = sys.total_physical_memory;
    snap.system_available = sys.available_physical_memory;
    snap.monitoring_active = monitoring_active();

    RegistryLock lock(*this);
    snap.taken_at = Clock::now();
    snap.pools.reserve(pools_.size());
    for (const auto& pool : pools_) {
        PoolSnapshot ps;
        ps.name = pool->name();
        ps.capacity = pool->capacity();
        ps.used = pool->used();
        ps.block_count = pool->block_count();
        ps.priority_distribution = pool->priority_distribution();
        ps.globally_evictable = pool->globally_evictable();
        ps.eviction_rank = pool->eviction_rank();
        snap.total_capacity += ps.capacity;
        snap.pools.push_back(std::move(ps));
    }
    snap.total_used = total_used_;
    snap.global_limit = config_.global_memory_limit;
    snap.peak_usage = peak_usage_;
    snap.warning_threshold = config_.warning_threshold;
    snap.critical_threshold = config_.critical_threshold;
    snap.auto_cleanup_enabled = config_.auto_cleanup_enabled;
    snap.deferred_payloads = deferred_release_.size();
    snap.counters = counters_;
    return snap;
}

std::optional<PoolSnapshot> MemoryManager::pool_info(const std::string& pool_name) const {
    RegistryLock lock(*this);
    const MemoryPool* pool = find_pool(pool_name);
    if (!pool) return std::nullopt;
    PoolSnapshot ps;
    ps.name = pool->name();
    ps.capacity = pool->capacity();
    ps.used = pool->used();
    ps.block_count = pool->block_count();
    ps.priority_distribution = pool->priority_distribution();
    ps.globally_evictable = pool->globally_evictable();
    ps.eviction_rank = pool->eviction_rank();
    return ps;
}

std::vector<AllocationRecord> MemoryManager::allocation_history() const {
    RegistryLock lock(*this);
    return {history_.begin(), history_.end()};
}

ManagerCounters MemoryManager::counters() const {
    RegistryLock lock(*this);
    return counters_;
}

bool MemoryManager::verify_accounting() const {
    RegistryLock lock(*this);
    size_t blocks = 0;
    for (const auto& pool : pools_) {
        if (!pool->check_invariants()) return false;
        blocks += pool->block_count();
    }
    return recompute_total() == total_used_ && blocks == block_owner_.size();
}

} // namespace vmm::mem
