#include "apps/det/CellBank.hpp"

#include <algorithm>

namespace det {

static inline int clampi(int x, int lo, int hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

void CellBank::reshape(const GridConfig& grid, uint16_t energy_window) {
    m_rows = clampi(grid.rows, 1, msg::MAX_GRID_DIM);
    m_cols = clampi(grid.cols, 1, msg::MAX_GRID_DIM);
    m_count = static_cast<std::size_t>(m_rows * m_cols);
    m_energy_window = static_cast<uint16_t>(
        clampi(energy_window, 2, DetectorConfig::MAX_ENERGY_WINDOW));
    clear();
}

bool CellBank::needsReshape(const GridConfig& grid, uint16_t energy_window) const {
    const int rows = clampi(grid.rows, 1, msg::MAX_GRID_DIM);
    const int cols = clampi(grid.cols, 1, msg::MAX_GRID_DIM);
    const uint16_t window = static_cast<uint16_t>(
        clampi(energy_window, 2, DetectorConfig::MAX_ENERGY_WINDOW));
    return m_count == 0 || rows != m_rows || cols != m_cols || window != m_energy_window;
}

void CellBank::clear() {
    for (auto& cell : m_cells) {
        cell = CellState{};
    }
}

void CellBank::clearTriggers(bool rearm) {
    for (std::size_t i = 0; i < m_count; ++i) {
        CellState& cell = m_cells[i];
        cell.delta_smooth = 0.0f;
        cell.hold = 0;
        cell.refractory = 0;
        cell.below_low = rearm;
        clearEnergy(i);
    }
}

void CellBank::clearEnergy(std::size_t i) {
    CellState& cell = m_cells[i];
    std::fill(cell.energy.begin(), cell.energy.end(), 0.0f);
    cell.energy_sum = 0.0f;
    cell.energy_head = 0;
}

void CellBank::pushEnergy(std::size_t i, float sample) {
    CellState& cell = m_cells[i];
    float& slot = cell.energy[cell.energy_head];
    cell.energy_sum += sample - slot;
    slot = sample;
    cell.energy_head = static_cast<uint8_t>((cell.energy_head + 1) % m_energy_window);

    // Running sums of floats drift; never let rounding push it negative.
    if (cell.energy_sum < 0.0f) cell.energy_sum = 0.0f;
}

} // namespace det
