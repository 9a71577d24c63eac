#include "apps/det/BaselineTracker.hpp"

#include <algorithm>
#include <array>

namespace det {

BaselineTracker::BaselineTracker(const DetectorConfig& cfg) {
    setConfig(cfg);
}

void BaselineTracker::setConfig(const DetectorConfig& cfg) {
    // sanitise() clamps alpha to [0.01, 0.99]
    m_alpha = sanitise(cfg).ema_alpha;
}

float BaselineTracker::median(float* values, std::size_t n) {
    if (n == 0) return 0.0f;

    const std::size_t m = n / 2;
    std::nth_element(values, values + m, values + n);
    const float upper = values[m];
    if (n % 2) return upper;

    // Even count: mean of the two middle values. After nth_element the
    // lower middle is the max of the left partition.
    const float lower = *std::max_element(values, values + m);
    return 0.5f * (lower + upper);
}

void BaselineTracker::update(const msg::CellFrame& in, CellBank& bank, TrackOutput& out) const {
    const std::size_t n = std::min<std::size_t>(bank.size(), in.cell_count);
    const float a = m_alpha;

    out = TrackOutput{};
    if (n == 0) return;

    std::array<float, msg::MAX_CELLS> raw_delta{};
    std::array<float, msg::MAX_CELLS> scratch{};

    for (std::size_t i = 0; i < n; ++i) {
        CellState& cell = bank[i];
        cell.baseline += a * (in.luma[i] - cell.baseline);
        raw_delta[i] = in.luma[i] - cell.baseline;
    }

    std::copy(raw_delta.begin(), raw_delta.begin() + n, scratch.begin());
    const float med = median(scratch.data(), n);
    out.median_delta = med;

    float hot_val = 0.0f;
    int hot_idx = -1;

    for (std::size_t i = 0; i < n; ++i) {
        CellState& cell = bank[i];
        const float corrected = raw_delta[i] - med;
        cell.delta_smooth += a * (corrected - cell.delta_smooth);

        if (hot_idx < 0 || cell.delta_smooth > hot_val) {
            hot_val = cell.delta_smooth;
            hot_idx = static_cast<int>(i);
        }
    }

    out.hot_index = hot_idx;
    out.hot_value = hot_val;
}

} // namespace det
