#pragma once
#include "mem/memory_snapshot.hpp"
#include <string>

namespace vmm::mem {

class MemoryManager;

/**
 * @brief Renders manager snapshots for humans and tooling
 *
 * Capturing happens under the manager lock; formatting runs on the copy.
 */
class MemoryStatsReporter {
public:
    explicit MemoryStatsReporter(const MemoryManager& manager) : manager_(manager) {}

    MemorySnapshot capture() const;

    std::string text_report() const { return format_text(capture()); }
    std::string json_report() const { return format_json(capture()); }

    static std::string format_text(const MemorySnapshot& snap);
    static std::string format_json(const MemorySnapshot& snap);

    // Pool usages sum to total_used and each pool stays within capacity.
    static bool report_consistent(const MemorySnapshot& snap);

private:
    const MemoryManager& manager_;
};

} // namespace vmm::mem
