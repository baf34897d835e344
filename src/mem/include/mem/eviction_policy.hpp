#pragma once
#include "mem/memory_pool.hpp"
#include <vector>

namespace vmm::mem {

struct EvictionPlan {
    std::vector<BlockId> victims;  // in eviction order
    uint64_t planned_bytes = 0;
    bool satisfied = false;        // planned_bytes >= required
};

/**
 * @brief Priority-first, then LRU, then LFU victim selection
 *
 * Candidates are ordered by (priority ascending, last_access_at ascending,
 * access_count ascending). Critical blocks are never candidates.
 */
class EvictionPolicy {
public:
    /**
     * @brief True if a should be evicted before b
     */
    static bool evicts_before(const Block& a, const Block& b);

    /**
     * @brief Pick blocks from pool until their sizes cover required bytes
     * @param pool Pool to select from (not modified)
     * @param required Bytes that must be freed
     * @return Victims in order; satisfied is false when the candidates ran out first
     */
    static EvictionPlan plan(const MemoryPool& pool, uint64_t required);

    // All non-Critical blocks of the pool, eviction order.
    static std::vector<const Block*> ordered_candidates(const MemoryPool& pool);
};

} // namespace vmm::mem
