#pragma once
#include "mem/memory_types.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace vmm::mem {

/**
 * @brief Bounded, named collection of blocks for one workload class
 *
 * Keeps used() equal to the sum of contained block sizes and the priority
 * distribution equal to the actual block counts. Not synchronized: the owning
 * MemoryManager serializes every access.
 */
class MemoryPool {
public:
    MemoryPool(std::string name, uint64_t capacity, bool globally_evictable = false, int eviction_rank = 0);

    MemoryPool(const MemoryPool&) = delete;
    MemoryPool& operator=(const MemoryPool&) = delete;

    const std::string& name() const { return name_; }

    uint64_t capacity() const { return capacity_; }
    void set_capacity(uint64_t capacity) { capacity_ = capacity; }

    uint64_t used() const { return used_; }
    uint64_t available() const { return used_ >= capacity_ ? 0 : capacity_ - used_; }
    double occupancy() const;

    bool globally_evictable() const { return globally_evictable_; }
    int eviction_rank() const { return eviction_rank_; }

    size_t block_count() const { return blocks_.size(); }
    const PriorityCounts& priority_distribution() const { return priority_distribution_; }
    size_t count(Priority p) const { return priority_distribution_[priority_index(p)]; }

    // Bytes held by blocks that eviction is allowed to take (everything but Critical).
    uint64_t evictable_bytes() const;

    bool contains(BlockId id) const { return blocks_.count(id) != 0; }
    Block* find(BlockId id);
    const Block* find(BlockId id) const;
    const std::unordered_map<BlockId, Block>& blocks() const { return blocks_; }

    /**
     * @brief Insert a block and charge its size
     * @return false if the id is already present (nothing changes)
     */
    bool insert(Block block);

    /**
     * @brief Remove a block and refund its size
     * @return The removed block, or nullopt if the id is not in this pool
     */
    std::optional<Block> extract(BlockId id);

    // Recomputes used/priority counts from the blocks and compares with the ledger.
    bool check_invariants() const;

private:
    std::string name_;
    uint64_t capacity_ = 0;
    uint64_t used_ = 0;
    bool globally_evictable_ = false;
    int eviction_rank_ = 0;
    std::unordered_map<BlockId, Block> blocks_;
    PriorityCounts priority_distribution_{};
};

} // namespace vmm::mem
