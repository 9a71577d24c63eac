#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "msg/CellFrame.hpp"
#include "msg/StepEvent.hpp"
#include "apps/det/CellBank.hpp"
#include "apps/det/DetectorConfig.hpp"

namespace det {

// At most one event per cell per tick.
using StepArray = std::array<msg::Step, msg::MAX_CELLS>;

// ---------------------------------------------------------------------------
// EventDetector: per-cell trigger logic on top of BaselineTracker output.
// Stateless from outside, the per-cell state lives in the CellBank passed in.
// Call evaluate() once per tick, after BaselineTracker::update().
// ---------------------------------------------------------------------------
class EventDetector {
public:
    explicit EventDetector(const DetectorConfig& cfg = {});

    void setConfig(const DetectorConfig& cfg);
    const DetectorConfig& getConfig() const { return m_cfg; }

    // Evaluate every cell against this tick's delta_smooth snapshot (and colour
    // fractions when the frame carries them). Confirmed events are written to
    // 'out' in ascending cell index; returns how many.
    //
    // 'bias' is the kind given to events the colour gate cannot decide, i.e.
    // INPUT while the round waits for input, REVEAL otherwise.
    std::size_t evaluate(const msg::CellFrame& in, CellBank& bank,
                         msg::EventKind bias, uint32_t frame_index, uint64_t t_ms,
                         StepArray& out) const;

    // Added to the confidence of events confirmed by the energy path only.
    static constexpr float ENERGY_CONFIDENCE_OFFSET = 0.25f;

private:
    DetectorConfig m_cfg{};
    float m_energy_threshold = 0.0f;

    msg::EventKind classify(float reveal_frac, float input_frac, msg::EventKind bias) const;
};

} // namespace det
