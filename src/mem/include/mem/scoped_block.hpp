#pragma once
#include "core/expected.hpp"
#include "mem/memory_types.hpp"
#include <string>

namespace vmm::mem {

class MemoryManager;

/**
 * @brief Reserves pool budget for the lifetime of a scope
 *
 * The block carries no payload. Destruction deallocates it; a block already
 * evicted by then is ignored.
 */
class ScopedBlock {
public:
    static expected<ScopedBlock, MemoryError> acquire(MemoryManager& manager, const std::string& pool_name,
                                                      uint64_t size, Priority priority = Priority::Medium,
                                                      std::string description = {});

    ScopedBlock(ScopedBlock&& other) noexcept;
    ScopedBlock& operator=(ScopedBlock&& other) noexcept;
    ScopedBlock(const ScopedBlock&) = delete;
    ScopedBlock& operator=(const ScopedBlock&) = delete;
    ~ScopedBlock();

    BlockId id() const { return id_; }
    bool valid() const { return manager_ != nullptr && id_ != kInvalidBlockId; }

    // Deallocate now instead of at scope exit.
    void reset();

private:
    ScopedBlock(MemoryManager& manager, BlockId id) : manager_(&manager), id_(id) {}

    MemoryManager* manager_ = nullptr;
    BlockId id_ = kInvalidBlockId;
};

} // namespace vmm::mem
