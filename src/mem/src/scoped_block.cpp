#include "mem/scoped_block.hpp"
#include "mem/memory_manager.hpp"
#include "core/log.hpp"

namespace vmm::mem {

expected<ScopedBlock, MemoryError> ScopedBlock::acquire(MemoryManager& manager, const std::string& pool_name,
                                                        uint64_t size, Priority priority, std::string description) {
    auto id = manager.allocate(pool_name, size, nullptr, priority, std::move(description));
    if (!id) {
        vmm::log::warn("Scoped allocation of " + std::to_string(size) + " bytes in " + pool_name + " failed: " +
                       error_name(id.error()));
        return make_unexpected(id.error());
    }
    return ScopedBlock(manager, *id);
}

ScopedBlock::ScopedBlock(ScopedBlock&& other) noexcept
    : manager_(other.manager_)
    , id_(other.id_) {
    other.manager_ = nullptr;
    other.id_ = kInvalidBlockId;
}

ScopedBlock& ScopedBlock::operator=(ScopedBlock&& other) noexcept {
    if (this != &other) {
        reset();
        manager_ = other.manager_;
        id_ = other.id_;
        other.manager_ = nullptr;
        other.id_ = kInvalidBlockId;
    }
    return *this;
}

ScopedBlock::~ScopedBlock() {
    reset();
}

void ScopedBlock::reset() {
    if (!valid()) return;
    manager_->deallocate(id_);
    manager_ = nullptr;
    id_ = kInvalidBlockId;
}

} // namespace vmm::mem
