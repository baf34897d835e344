#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace vmm::mem {

using Clock = std::chrono::steady_clock;

using BlockId = uint64_t;
constexpr BlockId kInvalidBlockId = 0;

namespace units {
constexpr uint64_t KiB = 1024ull;
constexpr uint64_t MiB = 1024ull * KiB;
constexpr uint64_t GiB = 1024ull * MiB;
} // namespace units

// Names of the fixed pool registry.
namespace pools {
inline constexpr const char* kVideoFrames = "video_frames";
inline constexpr const char* kPreviewCache = "preview_cache";
inline constexpr const char* kEffectsProcessing = "effects_processing";
inline constexpr const char* kAiModels = "ai_models";
inline constexpr const char* kTempData = "temp_data";
inline constexpr const char* kThumbnails = "thumbnails";
} // namespace pools

/**
 * @brief Eviction order hint. Lower values are evicted first; Critical never is.
 */
enum class Priority : uint8_t {
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

constexpr size_t kPriorityCount = 4;

inline constexpr size_t priority_index(Priority p) { return static_cast<size_t>(p) - 1; }

const char* priority_name(Priority p) noexcept;

using PriorityCounts = std::array<size_t, kPriorityCount>;

enum class MemoryError {
    PoolNotFound,
    InvalidSize,
    PoolExhausted,
    GlobalLimitExceeded,
    InvalidResize,
    ShutDown
};

const char* error_name(MemoryError e) noexcept;

/**
 * @brief Base class of everything stored in a block
 *
 * Payload types opt into extra behaviour by also deriving from a capability
 * interface such as Releasable.
 */
class Payload {
public:
    virtual ~Payload() = default;
};

using PayloadPtr = std::shared_ptr<Payload>;

/**
 * @brief Capability: payload holds an external resource that must be closed
 * when its block leaves accounting.
 */
class Releasable {
public:
    virtual ~Releasable() = default;
    virtual void release() = 0;
};

// Generic holder for plain values (cached images, model weights, scratch buffers).
template <typename T>
class ValuePayload : public Payload {
public:
    explicit ValuePayload(T v) : value(std::move(v)) {}
    T value;
};

template <typename T, typename... Args>
std::shared_ptr<ValuePayload<T>> make_value_payload(Args&&... args) {
    return std::make_shared<ValuePayload<T>>(T(std::forward<Args>(args)...));
}

/**
 * @brief One tracked allocation unit
 *
 * Owned by exactly one MemoryPool. size never changes after creation.
 */
struct Block {
    BlockId id = kInvalidBlockId;
    uint64_t size = 0;
    Priority priority = Priority::Medium;
    PayloadPtr payload;
    Clock::time_point created_at{};
    Clock::time_point last_access_at{};
    uint64_t access_count = 0;
    uint64_t access_sequence = 0; // manager-wide logical clock, strict total order of accesses
    std::string description;
    std::set<std::string> tags;

    void touch(Clock::time_point now, uint64_t sequence) {
        if (now > last_access_at) last_access_at = now;
        ++access_count;
        access_sequence = sequence;
    }

    bool has_tag(const std::string& tag) const { return tags.count(tag) != 0; }
};

// Metadata copy of a block handed out to callers; never exposes the payload.
struct BlockInfo {
    BlockId id = kInvalidBlockId;
    std::string pool;
    uint64_t size = 0;
    Priority priority = Priority::Medium;
    Clock::time_point created_at{};
    Clock::time_point last_access_at{};
    uint64_t access_count = 0;
    std::string description;
    std::set<std::string> tags;
    bool has_payload = false;
};

} // namespace vmm::mem
