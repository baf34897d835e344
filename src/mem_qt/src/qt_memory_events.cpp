#include "mem_qt/qt_memory_events.hpp"
#include "mem/memory_manager.hpp"
#include "core/log.hpp"

namespace vmm::mem_qt {

QtMemoryEvents::QtMemoryEvents(vmm::mem::MemoryManager& manager, QObject* parent)
    : QObject(parent)
    , manager_(manager) {
    vmm::mem::MemoryEventCallbacks callbacks;
    callbacks.memory_warning = [this](const std::string& kind, uint64_t current, uint64_t threshold) {
        emit memoryWarning(QString::fromStdString(kind), current, threshold);
    };
    callbacks.pool_overflow = [this](const std::string& pool, uint64_t used, uint64_t capacity) {
        emit poolOverflow(QString::fromStdString(pool), used, capacity);
    };
    callbacks.memory_freed = [this](uint64_t size, const std::string& reason) {
        emit memoryFreed(size, QString::fromStdString(reason));
    };
    callbacks.allocation_failed = [this](const std::string& reason, uint64_t requested) {
        emit allocationFailed(QString::fromStdString(reason), requested);
    };
    subscription_ = manager_.events().subscribe(std::move(callbacks));
    vmm::log::debug("Qt memory event bridge attached");
}

QtMemoryEvents::~QtMemoryEvents() {
    manager_.events().unsubscribe(subscription_);
}

} // namespace vmm::mem_qt
