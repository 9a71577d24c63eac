#pragma once
#include <array>
#include <cstdint>
#include <cstddef>

#include "types.hpp"
#include "msg/CellFrame.hpp"
#include "apps/det/DetectorConfig.hpp"

namespace det {

// Runtime state of one grid cell. Mutated once per tick, or by calibrate/reset.
struct CellState {
    float   baseline     = 0.0f;  // EMA of raw luminance
    float   delta_smooth = 0.0f;  // drift-corrected, smoothed delta
    uint8_t hold         = 0;     // consecutive ticks at/above thr_high
    uint8_t refractory   = 0;     // cooldown ticks left
    bool    below_low    = false; // re-armed: has dropped below thr_low since the last event

    // Quick-flash energy ring: last energy_window samples of max(0, v - thr_low).
    std::array<float, DetectorConfig::MAX_ENERGY_WINDOW> energy{};
    float   energy_sum  = 0.0f;
    uint8_t energy_head = 0;
};

// ---------------------------------------------------------------------------
// CellBank: the exclusively-owned per-cell state of the detection pipeline.
// Passed by reference into BaselineTracker / EventDetector / Calibrator; none
// of them keep their own copy. Recreated whenever grid shape or energy
// window changes.
// ---------------------------------------------------------------------------
class CellBank {
public:
    CellBank() = default;

    // Drop all state and size the bank for a new grid / energy window.
    void reshape(const GridConfig& grid, uint16_t energy_window);

    // True if reshape() would be needed for this grid / window.
    bool needsReshape(const GridConfig& grid, uint16_t energy_window) const;

    // Zero every cell but keep the shape.
    void clear();

    // Clear hysteresis, refractory and energy state; baselines stay.
    void clearTriggers(bool rearm);

    void clearEnergy(std::size_t i);
    // Push one energy sample into cell i's ring, keeping the running sum.
    void pushEnergy(std::size_t i, float sample);

    CellState&       operator[](std::size_t i)       { return m_cells[i]; }
    const CellState& operator[](std::size_t i) const { return m_cells[i]; }

    std::size_t size() const { return m_count; }
    int rows() const { return m_rows; }
    int cols() const { return m_cols; }
    uint16_t energyWindow() const { return m_energy_window; }

private:
    std::array<CellState, msg::MAX_CELLS> m_cells{};
    std::size_t m_count = 0;
    int m_rows = 0;
    int m_cols = 0;
    uint16_t m_energy_window = 0;
};

} // namespace det
