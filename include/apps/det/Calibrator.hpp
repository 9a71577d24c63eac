#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "msg/CellFrame.hpp"
#include "apps/det/CellBank.hpp"

namespace det {

// ---------------------------------------------------------------------------
// Calibrator: averages raw cell luminance over a short window of delivered
// frames and seeds the bank baselines with the result.
//
// Time only advances through feed()/poll(), so the window is bound to the
// frame cadence: the task calls feed() per frame and poll() when idle.
// Frames without a valid sample are skipped and not counted.
// ---------------------------------------------------------------------------
class Calibrator {
public:
    Calibrator() = default;

    // Start a new window. Any window in progress is discarded.
    void begin(uint64_t now_ms, uint32_t window_ms, std::size_t cell_count);

    // Abandon the current window without touching the bank.
    void cancel() { m_active = false; }

    // Accumulate one frame. Returns true once the window has elapsed.
    bool feed(const msg::CellFrame& in, uint64_t now_ms);

    // Frame drought check. Returns true once the window has elapsed.
    bool poll(uint64_t now_ms) const;

    // Seed baselines with the window mean, clear trigger state and re-arm
    // every cell. Ends the window.
    void apply(CellBank& bank);

    bool active() const { return m_active; }
    uint32_t frameCount() const { return m_count; }

private:
    bool m_active = false;
    uint64_t m_start_ms = 0;
    uint32_t m_window_ms = 0;
    std::size_t m_cells = 0;

    std::array<double, msg::MAX_CELLS> m_sum{};
    uint32_t m_count = 0;
};

} // namespace det
