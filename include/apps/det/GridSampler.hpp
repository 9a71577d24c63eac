#pragma once
#include <cstdint>

#include <opencv2/core.hpp>

#include "types.hpp"
#include "msg/ImageFrame.hpp"
#include "msg/CellFrame.hpp"
#include "apps/det/DetectorConfig.hpp"

namespace det {

struct Hsv {
    float h; // degrees, 0..360
    float s; // 0..1
    float v; // 0..1
};

// Rec.709 luma on 0..255 channels.
inline float luminance(float r, float g, float b) {
    return 0.2126f * r + 0.7152f * g + 0.0722f * b;
}

Hsv rgbToHsv(uint8_t r, uint8_t g, uint8_t b);

// Circular distance between two hues, 0..180 degrees.
float hueDistDeg(float a, float b);

// Colour classification parameters resolved once per config change.
struct ColorTargets {
    float reveal_hue_deg = 0.0f;
    float input_hue_deg  = 0.0f;
    float hue_tol_deg    = 0.0f;
    float sat_min        = 0.0f;
    float val_min        = 0.0f;
};

ColorTargets makeColorTargets(const DetectorConfig& cfg);

// ---------------------------------------------------------------------------
// GridSampler: one frame in, one CellFrame out.
// The ROI is downsampled to at most MAX_WORK_SIDE px on its longer side, then
// every cell is read on a strided lattice inside its padded interior.
// Never fails loudly: no pixels or an empty ROI give an all-zero, invalid frame.
// ---------------------------------------------------------------------------
class GridSampler {
public:
    static constexpr int MAX_WORK_SIDE = 480;
    static constexpr int SAMPLES_PER_SIDE = 10;

    GridSampler() = default;

    // Luminance only. Returns out.valid.
    bool sample(const msg::ImageFrame& img, const Rect& roi, const GridConfig& grid,
                float padding_pct, msg::CellFrame& out);

    // Luminance plus reveal/input colour fractions. Returns out.valid.
    bool sample(const msg::ImageFrame& img, const Rect& roi, const GridConfig& grid,
                float padding_pct, const ColorTargets& color, msg::CellFrame& out);

    // Size of the working image of the last successful sample (diagnostic).
    int workWidth()  const { return m_work_w; }
    int workHeight() const { return m_work_h; }

private:
    // Reused between frames so steady-state sampling does not allocate.
    cv::Mat m_scaled;
    cv::Mat m_bgr;

    int m_work_w = 0;
    int m_work_h = 0;

    bool sampleImpl(const msg::ImageFrame& img, const Rect& roi, const GridConfig& grid,
                    float padding_pct, const ColorTargets* color, msg::CellFrame& out);

    // Crop + downsample + convert to BGR8. Returns false when there is nothing to read.
    bool prepareWorkImage(const msg::ImageFrame& img, const Rect& roi, cv::Mat& work);

    static void clearFrame(const GridConfig& grid, msg::CellFrame& out);
};

} // namespace det
