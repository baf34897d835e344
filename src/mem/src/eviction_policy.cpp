#include "mem/eviction_policy.hpp"
#include <algorithm>

namespace vmm::mem {

bool EvictionPolicy::evicts_before(const Block& a, const Block& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    if (a.last_access_at != b.last_access_at) return a.last_access_at < b.last_access_at;
    if (a.access_count != b.access_count) return a.access_count < b.access_count;
    // Same clock reading and count: fall back to the logical access order
    return a.access_sequence < b.access_sequence;
}

std::vector<const Block*> EvictionPolicy::ordered_candidates(const MemoryPool& pool) {
    std::vector<const Block*> candidates;
    candidates.reserve(pool.block_count());
    for (const auto& [id, block] : pool.blocks()) {
        if (block.priority == Priority::Critical) {
            continue;
        }
        candidates.push_back(&block);
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const Block* a, const Block* b) { return evicts_before(*a, *b); });
    return candidates;
}

EvictionPlan EvictionPolicy::plan(const MemoryPool& pool, uint64_t required) {
    EvictionPlan result;
    if (required == 0) {
        result.satisfied = true;
        return result;
    }

    for (const Block* block : ordered_candidates(pool)) {
        if (result.planned_bytes >= required) {
            break;
        }
        result.victims.push_back(block->id);
        result.planned_bytes += block->size;
    }

    result.satisfied = result.planned_bytes >= required;
    return result;
}

} // namespace vmm::mem
