#pragma once
#include <cstdint>

namespace msg {

// Packed pixel layouts the pipeline understands.
enum class PixelFormat : uint8_t {
    UNKNOWN = 0,
    GRAY8   = 1,   // 1 byte/px
    BGR8    = 2,   // 3 bytes/px, OpenCV default order
    BGRA8   = 3,   // 4 bytes/px, screen grabbers
};

constexpr uint8_t bytesPerPixel(PixelFormat f) {
    return f == PixelFormat::GRAY8 ? 1
         : f == PixelFormat::BGR8  ? 3
         : f == PixelFormat::BGRA8 ? 4
         : 0;
}

struct ImageFrame {
    // Non-owning pointer to the first byte of a contiguous image buffer
    // const to prevent modification
    const uint8_t* data = nullptr;

    // Image dimensions in pixels. 0x0 means "source has no picture yet".
    uint32_t width  = 0;        // pixels
    uint32_t height = 0;        // pixels

    // Stride = number of BYTES between the start of row v and the start of row v+1.
    // For tightly packed images: stride == width * bytes_per_px.
    // For aligned/padded images: stride may be larger
    uint32_t stride = 0;        // bytes per row

    PixelFormat format = PixelFormat::UNKNOWN;

    uint64_t t_capture_us = 0;  // capture timestamp (Rtos::NowUs clock, µs)
    uint32_t frame_id = 0;      // increasing counter

    // Slot in the frame source's buffer pool; must come back on the release queue.
    uint16_t buf_index = 0;

    constexpr bool hasPixels() const {
        return data != nullptr && width > 0 && height > 0 &&
               bytesPerPixel(format) > 0;
    }
    constexpr uint32_t byteSize() const { return stride * height; }
};

} // namespace msg
