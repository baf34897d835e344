#include "mem/memory_stats.hpp"
#include "mem/memory_manager.hpp"
#include <iomanip>
#include <sstream>

namespace vmm::mem {

namespace {

double to_mb(uint64_t bytes) {
    return static_cast<double>(bytes) / static_cast<double>(units::MiB);
}

// Pool names are registry identifiers, only quotes and backslashes need care
std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

MemorySnapshot MemoryStatsReporter::capture() const {
    return manager_.snapshot();
}

std::string MemoryStatsReporter::format_text(const MemorySnapshot& snap) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "=== Memory Manager Statistics ===\n";
    out << "Process memory:   " << to_mb(snap.process_resident) << " MB";
    if (snap.system_total > 0) {
        out << " of " << to_mb(snap.system_total) << " MB system, " << to_mb(snap.system_available)
            << " MB available";
    }
    out << "\n";
    out << "Managed usage:    " << to_mb(snap.total_used) << " MB / " << to_mb(snap.global_limit) << " MB limit ("
        << snap.global_usage_ratio() * 100.0 << "%)\n";
    out << "Pool capacity:    " << to_mb(snap.total_capacity) << " MB\n";
    out << "Peak usage:       " << to_mb(snap.peak_usage) << " MB\n";
    out << "Thresholds:       warning " << snap.warning_threshold * 100.0 << "%, critical "
        << snap.critical_threshold * 100.0 << "%\n";
    out << "Monitoring:       " << (snap.monitoring_active ? "active" : "stopped")
        << ", auto cleanup " << (snap.auto_cleanup_enabled ? "on" : "off") << "\n";
    out << "Operations:       " << snap.counters.allocations << " alloc, " << snap.counters.deallocations
        << " dealloc, " << snap.counters.evictions << " evicted, " << snap.counters.failed_allocations
        << " failed\n";
    out << "Deferred release: " << snap.deferred_payloads << " pending, " << snap.counters.deferred_released
        << " released\n";

    out << "\nPools:\n";
    for (const auto& pool : snap.pools) {
        out << "  " << std::left << std::setw(20) << pool.name << std::right << std::setw(9) << to_mb(pool.used)
            << " / " << std::setw(8) << to_mb(pool.capacity) << " MB " << std::setw(6) << pool.usage_percent()
            << "%  blocks " << pool.block_count << " [L" << pool.priority_distribution[priority_index(Priority::Low)]
            << " M" << pool.priority_distribution[priority_index(Priority::Medium)] << " H"
            << pool.priority_distribution[priority_index(Priority::High)] << " C"
            << pool.priority_distribution[priority_index(Priority::Critical)] << "]";
        if (pool.globally_evictable) {
            out << " evictable rank " << pool.eviction_rank;
        }
        out << "\n";
    }
    return out.str();
}

std::string MemoryStatsReporter::format_json(const MemorySnapshot& snap) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(4);
    out << "{\"process_resident\":" << snap.process_resident
        << ",\"system_total\":" << snap.system_total
        << ",\"system_available\":" << snap.system_available
        << ",\"total_used\":" << snap.total_used
        << ",\"total_capacity\":" << snap.total_capacity
        << ",\"global_limit\":" << snap.global_limit
        << ",\"global_usage_ratio\":" << snap.global_usage_ratio()
        << ",\"peak_usage\":" << snap.peak_usage
        << ",\"warning_threshold\":" << snap.warning_threshold
        << ",\"critical_threshold\":" << snap.critical_threshold
        << ",\"monitoring_active\":" << (snap.monitoring_active ? "true" : "false")
        << ",\"auto_cleanup_enabled\":" << (snap.auto_cleanup_enabled ? "true" : "false")
        << ",\"deferred_payloads\":" << snap.deferred_payloads
        << ",\"counters\":{\"allocations\":" << snap.counters.allocations
        << ",\"deallocations\":" << snap.counters.deallocations
        << ",\"evictions\":" << snap.counters.evictions
        << ",\"failed_allocations\":" << snap.counters.failed_allocations
        << ",\"deferred_released\":" << snap.counters.deferred_released << "}"
        << ",\"pools\":[";

    bool first = true;
    for (const auto& pool : snap.pools) {
        if (!first) out << ",";
        first = false;
        out << "{\"name\":\"" << json_escape(pool.name) << "\""
            << ",\"capacity\":" << pool.capacity
            << ",\"used\":" << pool.used
            << ",\"occupancy\":" << pool.occupancy()
            << ",\"block_count\":" << pool.block_count
            << ",\"priority_distribution\":{\"low\":" << pool.priority_distribution[priority_index(Priority::Low)]
            << ",\"medium\":" << pool.priority_distribution[priority_index(Priority::Medium)]
            << ",\"high\":" << pool.priority_distribution[priority_index(Priority::High)]
            << ",\"critical\":" << pool.priority_distribution[priority_index(Priority::Critical)] << "}"
            << ",\"globally_evictable\":" << (pool.globally_evictable ? "true" : "false")
            << ",\"eviction_rank\":" << pool.eviction_rank << "}";
    }
    out << "]}";
    return out.str();
}

bool MemoryStatsReporter::report_consistent(const MemorySnapshot& snap) {
    uint64_t sum = 0;
    for (const auto& pool : snap.pools) {
        if (pool.used > pool.capacity) return false;
        size_t by_priority = 0;
        for (size_t n : pool.priority_distribution) by_priority += n;
        if (by_priority != pool.block_count) return false;
        sum += pool.used;
    }
    return sum == snap.total_used;
}

} // namespace vmm::mem
