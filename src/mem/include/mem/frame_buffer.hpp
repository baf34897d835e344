#pragma once
#include "core/expected.hpp"
#include "mem/memory_types.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace vmm::mem {

class MemoryManager;

namespace frame_tags {
inline constexpr const char* kVideoFrame = "video_frame";
inline constexpr const char* kBuffer = "buffer";
} // namespace frame_tags

/**
 * @brief Contiguous float frames, frame_count x height x width x channels
 */
class FrameBufferPayload : public Payload {
public:
    FrameBufferPayload(int width, int height, int channels, int frame_count);

    int width() const { return width_; }
    int height() const { return height_; }
    int channels() const { return channels_; }
    int frame_count() const { return frame_count_; }

    size_t samples_per_frame() const {
        return static_cast<size_t>(width_) * static_cast<size_t>(height_) * static_cast<size_t>(channels_);
    }

    float* frame_data(int index) { return samples_.data() + samples_per_frame() * static_cast<size_t>(index); }
    const float* frame_data(int index) const {
        return samples_.data() + samples_per_frame() * static_cast<size_t>(index);
    }

private:
    int width_;
    int height_;
    int channels_;
    int frame_count_;
    std::vector<float> samples_;
};

/**
 * @brief Non-owning view of one frame
 *
 * owner keeps the buffer alive even if the block is evicted while the view is held.
 */
struct FrameView {
    std::shared_ptr<FrameBufferPayload> owner;
    float* data = nullptr;
    int width = 0;
    int height = 0;
    int channels = 0;
    int index = 0;

    size_t sample_count() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(channels);
    }
};

// Bytes charged for a frame buffer: width x height x channels x 4 x frame_count.
// 0 for non-positive dimensions or a product that does not fit in 64 bits.
uint64_t frame_buffer_bytes(int width, int height, int channels = 3, int frame_count = 1);

/**
 * @brief Allocate a zeroed float frame buffer in the video_frames pool
 *
 * High priority, tagged video_frame and buffer.
 * @return Block id, InvalidSize for non-positive dimensions, or the allocation error
 */
expected<BlockId, MemoryError> create_frame_buffer(MemoryManager& manager, int width, int height,
                                                   int channels = 3, int frame_count = 1);

/**
 * @brief Frame index of a frame buffer block; counts as an access
 * @return nullopt for unknown ids, non-frame payloads or out-of-range indices
 */
std::optional<FrameView> get_video_frame(MemoryManager& manager, BlockId id, int index = 0);

} // namespace vmm::mem
