#include "apps/det/SequenceDetector.hpp"

#include <algorithm>
#include <iostream>

namespace det {

SequenceDetector::SequenceDetector(const DetectorConfig& cfg, const Rect& roi,
                                   const GridConfig& grid) {
    configure(roi, grid, cfg);
}

void SequenceDetector::configure(const Rect& roi, const GridConfig& grid,
                                 const DetectorConfig& cfg) {
    m_cfg = sanitise(cfg);
    m_roi = roi;
    m_grid.rows = std::max(1, std::min(grid.rows, msg::MAX_GRID_DIM));
    m_grid.cols = std::max(1, std::min(grid.cols, msg::MAX_GRID_DIM));
    m_color = makeColorTargets(m_cfg);

    m_tracker.setConfig(m_cfg);
    m_detector.setConfig(m_cfg);
    m_fsm.setConfig(m_cfg);

    if (m_bank.needsReshape(m_grid, m_cfg.energy_window)) {
        m_bank.reshape(m_grid, m_cfg.energy_window);
        if (m_calib.active()) m_calib.cancel();
        std::cout << "[SequenceDetector] grid " << m_grid.rows << "x" << m_grid.cols
                  << ", energy window " << m_cfg.energy_window
                  << ": cell state rebuilt\n";
    }
}

void SequenceDetector::start() {
    if (m_running) return;
    m_running = true;
    m_last_tick_ms = 0;
    std::cout << "[SequenceDetector] started\n";
}

void SequenceDetector::stop() {
    if (!m_running) return;
    m_running = false;
    std::cout << "[SequenceDetector] stopped at frame " << m_frame_index << "\n";
}

void SequenceDetector::beginCalibration(uint64_t now_ms) {
    m_calib.begin(now_ms, m_cfg.calibration_window_ms, m_bank.size());
    m_calibration_done = false;
    std::cout << "[SequenceDetector] calibrating for "
              << m_cfg.calibration_window_ms << " ms\n";
}

bool SequenceDetector::takeCalibrationDone() {
    const bool done = m_calibration_done;
    m_calibration_done = false;
    return done;
}

void SequenceDetector::finishCalibration() {
    m_calib.apply(m_bank);
    m_fsm.reset();
    m_calibration_done = true;
}

void SequenceDetector::reset() {
    m_calib.cancel();
    m_bank.clearTriggers(/*rearm=*/true);   // calibrated baselines survive a reset
    m_fsm.reset();
    m_cells = msg::CellFrame{};
    m_track = TrackOutput{};
    m_frame_index = 0;
    m_last_tick_ms = 0;
    m_fps = 0.0f;
}

void SequenceDetector::updateRate(uint64_t now_ms) {
    if (m_last_tick_ms != 0 && now_ms > m_last_tick_ms) {
        const float inst = 1000.0f / static_cast<float>(now_ms - m_last_tick_ms);
        m_fps = (m_fps > 0.0f) ? FPS_SMOOTHING * m_fps + (1.0f - FPS_SMOOTHING) * inst
                               : inst;
    }
    m_last_tick_ms = now_ms;
}

std::size_t SequenceDetector::tick(const msg::ImageFrame& frame, uint64_t now_ms,
                                   StepArray& events) {
    if (!m_running && !m_calib.active()) return 0;

    const bool valid = m_cfg.color_gate_enabled
        ? m_sampler.sample(frame, m_roi, m_grid, m_cfg.padding_pct, m_color, m_cells)
        : m_sampler.sample(frame, m_roi, m_grid, m_cfg.padding_pct, m_cells);
    m_cells.frame_id = frame.frame_id;
    m_cells.t_capture_us = frame.t_capture_us;

    updateRate(now_ms);
    m_frame_index++;

    // ---- Calibration window: no detection until it closes ----
    if (m_calib.active()) {
        if (m_calib.feed(m_cells, now_ms)) finishCalibration();
        return 0;
    }

    if (!m_running) return 0;

    m_fsm.poll(now_ms);

    // No signal this frame: leave baselines and triggers untouched.
    if (!valid) return 0;

    m_tracker.update(m_cells, m_bank, m_track);

    const std::size_t n = m_detector.evaluate(m_cells, m_bank, m_fsm.bias(),
                                              m_frame_index, now_ms, events);
    for (std::size_t i = 0; i < n; ++i) {
        m_fsm.onEvent(events[i]);
    }
    return n;
}

void SequenceDetector::poll(uint64_t now_ms) {
    if (m_calib.active()) {
        if (m_calib.poll(now_ms)) finishCalibration();
        return;
    }
    if (m_running) m_fsm.poll(now_ms);
}

msg::DetectorStatus SequenceDetector::status() const {
    msg::DetectorStatus s{};
    s.running = m_running ? 1 : 0;
    s.calibrating = m_calib.active() ? 1 : 0;
    s.round = m_fsm.state();
    s.step_count = static_cast<uint32_t>(m_fsm.steps().size());

    s.hot_index = static_cast<int16_t>(m_track.hot_index);
    if (m_track.hot_index >= 0) {
        const float c = m_track.hot_value / std::max(1.0f, m_cfg.thr_high);
        s.hot_confidence = std::max(0.0f, std::min(1.0f, c));
    }

    s.fps = m_fps;
    s.frame_index = m_frame_index;
    s.rows = static_cast<uint16_t>(m_grid.rows);
    s.cols = static_cast<uint16_t>(m_grid.cols);
    return s;
}

} // namespace det
