#pragma once
#include <cstdint>
#include <cstddef>
#include <array>

namespace msg {

// Grid capacity is fixed so per-cell buffers never allocate on the frame path.
constexpr int MAX_GRID_DIM = 16;
constexpr std::size_t MAX_CELLS = static_cast<std::size_t>(MAX_GRID_DIM) * MAX_GRID_DIM;

// Cell indexing is row-major: idx = row * cols + col.
struct CellFrame {
    std::array<float, MAX_CELLS> luma{};         // mean luminance per cell (0..255)
    std::array<float, MAX_CELLS> reveal_frac{};  // fraction of samples matching the reveal colour
    std::array<float, MAX_CELLS> input_frac{};   // fraction of samples matching the input colour

    uint16_t rows = 0;
    uint16_t cols = 0;
    uint16_t cell_count = 0;     // rows * cols

    uint8_t valid = 0;           // 0 = no signal this frame (no pixels / empty ROI)
    uint8_t has_color = 0;       // 1 = reveal_frac / input_frac were sampled

    // --- Measurement identity (copy-through from ImageFrame) ---
    uint64_t t_capture_us = 0;
    uint32_t frame_id = 0;
};

} // namespace msg
