#pragma once
#include <cstdint>

// Normalised rectangle, all fields in [0,1] of the frame.
// Producers must sanitise (see core::sanitiseRoi) before handing it to the pipeline.
struct Rect {
    float x = 0.2f;
    float y = 0.2f;
    float width  = 0.6f;
    float height = 0.6f;
};

// Grid shape inside the ROI. N = rows * cols, row-major indexing.
struct GridConfig {
    int rows = 6;
    int cols = 6;

    constexpr int cellCount() const { return rows * cols; }
};

constexpr bool operator==(const GridConfig& a, const GridConfig& b) {
    return a.rows == b.rows && a.cols == b.cols;
}
constexpr bool operator!=(const GridConfig& a, const GridConfig& b) { return !(a == b); }

struct Rgb8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

// Difficulty presets of the observed game; they only pick the grid shape.
enum class Difficulty : uint8_t {
    EASY = 0,    // 4x4
    MEDIUM,      // 5x5
    HARD,        // 6x6
    EXPERT,      // 6x6
};
