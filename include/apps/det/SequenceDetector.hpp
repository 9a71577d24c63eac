#pragma once
#include <cstddef>
#include <cstdint>

#include "types.hpp"
#include "msg/ImageFrame.hpp"
#include "msg/CellFrame.hpp"
#include "msg/RoundState.hpp"

#include "apps/det/DetectorConfig.hpp"
#include "apps/det/GridSampler.hpp"
#include "apps/det/CellBank.hpp"
#include "apps/det/BaselineTracker.hpp"
#include "apps/det/EventDetector.hpp"
#include "apps/det/Calibrator.hpp"
#include "apps/seq/RoundFSM.hpp"

namespace det {

// ---------------------------------------------------------------------------
// SequenceDetector: the whole per-frame pipeline behind one object.
//
//   ImageFrame -> GridSampler -> BaselineTracker -> EventDetector -> RoundFSM
//
// Owns the CellBank and every stage. Not thread-safe: DetectorTask is the
// only caller, and it applies commands between frames.
// ---------------------------------------------------------------------------
class SequenceDetector {
public:
    explicit SequenceDetector(const DetectorConfig& cfg = {},
                              const Rect& roi = {},
                              const GridConfig& grid = {});

    // Apply new ROI / grid / tunables. The bank is rebuilt only if the grid
    // shape or energy window changed (which drops all per-cell state).
    void configure(const Rect& roi, const GridConfig& grid, const DetectorConfig& cfg);

    void start();
    void stop();                   // halts ticking, state is kept
    bool running() const { return m_running; }

    // Start a calibration window at now_ms. Ticking is suspended until it ends.
    void beginCalibration(uint64_t now_ms);
    bool calibrating() const { return m_calib.active(); }

    // True once per finished calibration window.
    bool takeCalibrationDone();

    // Clear per-cell and round state. Config, ROI and grid are kept.
    void reset();
    void arm(uint64_t now_ms) { m_fsm.arm(now_ms); }
    bool undo() { return m_fsm.undo(); }

    // Process one frame observed at now_ms. Confirmed events of this tick are
    // written to 'events' in ascending cell order; returns how many.
    std::size_t tick(const msg::ImageFrame& frame, uint64_t now_ms, StepArray& events);

    // No-frame wake-up: round deadlines and the calibration window.
    void poll(uint64_t now_ms);

    msg::DetectorStatus status() const;

    const seq::RoundFSM& fsm() const { return m_fsm; }
    const CellBank& bank() const { return m_bank; }
    const msg::CellFrame& lastCells() const { return m_cells; }
    const DetectorConfig& config() const { return m_cfg; }
    const GridConfig& grid() const { return m_grid; }

    static constexpr float FPS_SMOOTHING = 0.9f;

private:
    void finishCalibration();
    void updateRate(uint64_t now_ms);

private:
    DetectorConfig m_cfg{};
    Rect m_roi{};
    GridConfig m_grid{};
    ColorTargets m_color{};

    GridSampler     m_sampler;
    CellBank        m_bank;
    BaselineTracker m_tracker;
    EventDetector   m_detector;
    Calibrator      m_calib;
    seq::RoundFSM   m_fsm;

    msg::CellFrame m_cells{};
    TrackOutput    m_track{};

    bool m_running = false;
    bool m_calibration_done = false;

    uint32_t m_frame_index = 0;
    uint64_t m_last_tick_ms = 0;
    float    m_fps = 0.0f;
};

} // namespace det
