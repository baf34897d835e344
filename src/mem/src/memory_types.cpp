#include "mem/memory_types.hpp"

namespace vmm::mem {

const char* priority_name(Priority p) noexcept {
    switch (p) {
        case Priority::Low: return "LOW";
        case Priority::Medium: return "MEDIUM";
        case Priority::High: return "HIGH";
        case Priority::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* error_name(MemoryError e) noexcept {
    switch (e) {
        case MemoryError::PoolNotFound: return "PoolNotFound";
        case MemoryError::InvalidSize: return "InvalidSize";
        case MemoryError::PoolExhausted: return "PoolExhausted";
        case MemoryError::GlobalLimitExceeded: return "GlobalLimitExceeded";
        case MemoryError::InvalidResize: return "InvalidResize";
        case MemoryError::ShutDown: return "ShutDown";
    }
    return "Unknown";
}

} // namespace vmm::mem
