#include "mem/frame_buffer.hpp"
#include "mem/memory_manager.hpp"
#include "core/log.hpp"
#include <limits>

namespace vmm::mem {

FrameBufferPayload::FrameBufferPayload(int width, int height, int channels, int frame_count)
    : width_(width)
    , height_(height)
    , channels_(channels)
    , frame_count_(frame_count)
    , samples_(samples_per_frame() * static_cast<size_t>(frame_count), 0.0f) {}

uint64_t frame_buffer_bytes(int width, int height, int channels, int frame_count) {
    if (width <= 0 || height <= 0 || channels <= 0 || frame_count <= 0) return 0;
    uint64_t bytes = sizeof(float);
    for (int factor : {width, height, channels, frame_count}) {
        const auto f = static_cast<uint64_t>(factor);
        if (bytes > std::numeric_limits<uint64_t>::max() / f) return 0;
        bytes *= f;
    }
    return bytes;
}

expected<BlockId, MemoryError> create_frame_buffer(MemoryManager& manager, int width, int height,
                                                   int channels, int frame_count) {
    const uint64_t size = frame_buffer_bytes(width, height, channels, frame_count);
    if (size == 0) {
        vmm::log::error("Invalid frame buffer geometry " + std::to_string(width) + "x" + std::to_string(height) +
                        "x" + std::to_string(channels) + " x" + std::to_string(frame_count));
        return make_unexpected(MemoryError::InvalidSize);
    }

    // Requests no eviction could satisfy fail before the samples are allocated
    if (auto pool = manager.pool_info(pools::kVideoFrames); pool && size > pool->capacity) {
        return manager.allocate(pools::kVideoFrames, size, nullptr, Priority::High);
    }

    auto payload = std::make_shared<FrameBufferPayload>(width, height, channels, frame_count);
    const std::string description = "video frame buffer " + std::to_string(width) + "x" + std::to_string(height) +
                                    "x" + std::to_string(channels) + " (" + std::to_string(frame_count) + " frames)";
    return manager.allocate(pools::kVideoFrames, size, std::move(payload), Priority::High, description,
                            {frame_tags::kVideoFrame, frame_tags::kBuffer});
}

std::optional<FrameView> get_video_frame(MemoryManager& manager, BlockId id, int index) {
    auto payload = manager.touch(id);
    if (!payload || !*payload) return std::nullopt;

    auto frames = std::dynamic_pointer_cast<FrameBufferPayload>(*payload);
    if (!frames || index < 0 || index >= frames->frame_count()) return std::nullopt;

    FrameView view;
    view.data = frames->frame_data(index);
    view.width = frames->width();
    view.height = frames->height();
    view.channels = frames->channels();
    view.index = index;
    view.owner = std::move(frames);
    return view;
}

} // namespace vmm::mem
