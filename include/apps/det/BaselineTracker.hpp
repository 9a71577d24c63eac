#pragma once
#include <cstddef>
#include <cstdint>

#include "msg/CellFrame.hpp"
#include "apps/det/CellBank.hpp"
#include "apps/det/DetectorConfig.hpp"

namespace det {

// Per-tick by-products of the tracker that are not part of the cell state.
struct TrackOutput {
    float median_delta = 0.0f;   // global drift removed this tick
    int   hot_index    = -1;     // argmax delta_smooth (diagnostic only)
    float hot_value    = 0.0f;
};

// ---------------------------------------------------------------------------
// BaselineTracker
//   baseline     += a * (raw - baseline)
//   raw_delta     = raw - baseline
//   corrected     = raw_delta - median(raw_delta over all cells)
//   delta_smooth += a * (corrected - delta_smooth)
// The median step cancels whole-screen brightness changes; a minority of
// genuinely flashing cells does not move it.
// ---------------------------------------------------------------------------
class BaselineTracker {
public:
    explicit BaselineTracker(const DetectorConfig& cfg = {});

    void setConfig(const DetectorConfig& cfg);

    // Consume one tick of raw luminance, update bank baselines / delta_smooth.
    void update(const msg::CellFrame& in, CellBank& bank, TrackOutput& out) const;

    // Median of the first n values (reorders them). 0 for n == 0.
    static float median(float* values, std::size_t n);

private:
    float m_alpha = 0.2f;
};

} // namespace det
