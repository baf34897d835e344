#pragma once
#include "mem/memory_events.hpp"
#include <QObject>
#include <QString>

namespace vmm::mem {
class MemoryManager;
}

namespace vmm::mem_qt {

/**
 * @brief Re-emits memory manager events as Qt signals
 *
 * Events may be raised on the monitor or cleanup thread; connect with
 * Qt::QueuedConnection (the default across threads) to receive them on the
 * UI thread. The bridge must not outlive the manager.
 */
class QtMemoryEvents : public QObject {
    Q_OBJECT

public:
    explicit QtMemoryEvents(vmm::mem::MemoryManager& manager, QObject* parent = nullptr);
    ~QtMemoryEvents() override;

signals:
    void memoryWarning(const QString& kind, quint64 current, quint64 threshold);
    void poolOverflow(const QString& pool, quint64 used, quint64 capacity);
    void memoryFreed(quint64 size, const QString& reason);
    void allocationFailed(const QString& reason, quint64 requestedSize);

private:
    vmm::mem::MemoryManager& manager_;
    vmm::mem::MemoryEventDispatcher::SubscriptionId subscription_;
};

} // namespace vmm::mem_qt
