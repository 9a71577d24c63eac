#include "apps/det/Calibrator.hpp"

#include <algorithm>
#include <iostream>

namespace det {

void Calibrator::begin(uint64_t now_ms, uint32_t window_ms, std::size_t cell_count) {
    m_active = true;
    m_start_ms = now_ms;
    m_window_ms = window_ms;
    m_cells = std::min<std::size_t>(cell_count, msg::MAX_CELLS);
    m_sum.fill(0.0);
    m_count = 0;
}

bool Calibrator::feed(const msg::CellFrame& in, uint64_t now_ms) {
    if (!m_active) return false;

    if (in.valid && in.cell_count == m_cells) {
        for (std::size_t i = 0; i < m_cells; ++i) {
            m_sum[i] += in.luma[i];
        }
        m_count++;
    }
    return poll(now_ms);
}

bool Calibrator::poll(uint64_t now_ms) const {
    if (!m_active) return false;
    return now_ms >= m_start_ms && (now_ms - m_start_ms) > m_window_ms;
}

void Calibrator::apply(CellBank& bank) {
    const std::size_t n = std::min(m_cells, bank.size());
    const double denom = static_cast<double>(std::max<uint32_t>(1, m_count));

    for (std::size_t i = 0; i < n; ++i) {
        bank[i].baseline = static_cast<float>(m_sum[i] / denom);
    }
    bank.clearTriggers(/*rearm=*/true);

    if (m_count == 0) {
        std::cerr << "[Calibrator] window elapsed without a valid frame, baselines zeroed\n";
    } else {
        std::cout << "[Calibrator] done: " << m_count << " frames, "
                  << n << " cells\n";
    }
    m_active = false;
}

} // namespace det
