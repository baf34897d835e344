#include "mem/memory_pool.hpp"

namespace vmm::mem {

MemoryPool::MemoryPool(std::string name, uint64_t capacity, bool globally_evictable, int eviction_rank)
    : name_(std::move(name))
    , capacity_(capacity)
    , globally_evictable_(globally_evictable)
    , eviction_rank_(eviction_rank) {}

double MemoryPool::occupancy() const {
    if (capacity_ == 0) return used_ > 0 ? 1.0 : 0.0;
    return static_cast<double>(used_) / static_cast<double>(capacity_);
}

uint64_t MemoryPool::evictable_bytes() const {
    uint64_t total = 0;
    for (const auto& [id, block] : blocks_) {
        if (block.priority != Priority::Critical) total += block.size;
    }
    return total;
}

Block* MemoryPool::find(BlockId id) {
    auto it = blocks_.find(id);
    return it != blocks_.end() ? &it->second : nullptr;
}

const Block* MemoryPool::find(BlockId id) const {
    auto it = blocks_.find(id);
    return it != blocks_.end() ? &it->second : nullptr;
}

bool MemoryPool::insert(Block block) {
    const BlockId id = block.id;
    const uint64_t size = block.size;
    const Priority priority = block.priority;
    auto [it, inserted] = blocks_.emplace(id, std::move(block));
    if (!inserted) return false;
    used_ += size;
    ++priority_distribution_[priority_index(priority)];
    return true;
}

std::optional<Block> MemoryPool::extract(BlockId id) {
    auto node = blocks_.extract(id);
    if (node.empty()) return std::nullopt;
    Block block = std::move(node.mapped());
    // used_ >= block.size holds because every insert charged it
    used_ -= block.size;
    --priority_distribution_[priority_index(block.priority)];
    return block;
}

bool MemoryPool::check_invariants() const {
    uint64_t sum = 0;
    PriorityCounts counts{};
    for (const auto& [id, block] : blocks_) {
        if (id != block.id || block.size == 0) return false;
        sum += block.size;
        ++counts[priority_index(block.priority)];
    }
    return sum == used_ && counts == priority_distribution_;
}

} // namespace vmm::mem
