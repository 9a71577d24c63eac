#include "apps/det/EventDetector.hpp"

#include <algorithm>

namespace det {

static inline float clampf(float x, float lo, float hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

EventDetector::EventDetector(const DetectorConfig& cfg) {
    setConfig(cfg);
}

void EventDetector::setConfig(const DetectorConfig& cfg) {
    m_cfg = sanitise(cfg);
    m_energy_threshold = (m_cfg.thr_high - m_cfg.thr_low) * m_cfg.energy_scale;
}

msg::EventKind EventDetector::classify(float reveal_frac, float input_frac,
                                       msg::EventKind bias) const {
    const bool reveal_ok = reveal_frac >= m_cfg.color_min_frac_reveal;
    const bool input_ok  = input_frac  >= m_cfg.color_min_frac_input;

    if (reveal_ok && !input_ok) return msg::EventKind::REVEAL;
    if (input_ok && !reveal_ok) return msg::EventKind::INPUT;

    // Both colours present: only a clear winner decides.
    const float ratio = m_cfg.color_dominance_ratio;
    if (reveal_frac > input_frac && reveal_frac >= input_frac * ratio) return msg::EventKind::REVEAL;
    if (input_frac > reveal_frac && input_frac >= reveal_frac * ratio) return msg::EventKind::INPUT;
    return bias;
}

std::size_t EventDetector::evaluate(const msg::CellFrame& in, CellBank& bank,
                                    msg::EventKind bias, uint32_t frame_index, uint64_t t_ms,
                                    StepArray& out) const {
    const std::size_t n = std::min<std::size_t>(bank.size(), in.cell_count);
    const int cols = std::max(1, bank.cols());

    const float thr_high = m_cfg.thr_high;
    const float thr_low  = m_cfg.thr_low;
    const bool quick = m_cfg.quick_flash_enabled;
    const bool gate  = m_cfg.color_gate_enabled && in.has_color;
    const bool relaxed = m_cfg.refractory_policy == RefractoryPolicy::RELAXED;

    std::size_t count = 0;

    for (std::size_t i = 0; i < n; ++i) {
        CellState& cell = bank[i];
        const float v = cell.delta_smooth;

        // ---- Cooldown ----
        if (cell.refractory > 0) {
            const bool bypass = relaxed && cell.below_low;
            cell.refractory--;
            if (!bypass) {
                cell.hold = 0;
                if (v < thr_low) cell.below_low = true;
                continue;
            }
        }

        // ---- Hysteresis ----
        if (v < thr_low) {
            // Samples from the tail of the last flash must not count toward the next one.
            if (!cell.below_low) bank.clearEnergy(i);
            cell.below_low = true;
            cell.hold = 0;
        }

        // Energy accumulates only while the cell is armed.
        if (quick && cell.below_low) {
            bank.pushEnergy(i, std::max(0.0f, v - thr_low));
        }

        bool by_hold = false;
        if (cell.below_low && v >= thr_high) {
            if (cell.hold < 255) cell.hold++;
            by_hold = cell.hold >= m_cfg.hold_frames;
        } else if (v < thr_high) {
            cell.hold = 0;   // hold counts consecutive ticks only
        }

        // Short flashes that never held long enough but carried enough energy.
        const bool by_energy = quick && cell.below_low && v > thr_low &&
                               cell.energy_sum > m_energy_threshold;

        if (!by_hold && !by_energy) continue;

        // ---- Colour gate ----
        msg::EventKind kind = bias;
        if (gate) {
            const float rf = in.reveal_frac[i];
            const float nf = in.input_frac[i];
            if (rf < m_cfg.color_min_frac_reveal && nf < m_cfg.color_min_frac_input) {
                continue;   // bright but wrong colour: not ours this tick
            }
            kind = classify(rf, nf, bias);
        }

        // ---- Confirmed ----
        float conf = (v - thr_high) / std::max(1.0f, thr_high);
        if (!by_hold) conf += ENERGY_CONFIDENCE_OFFSET;

        msg::Step& s = out[count++];
        s.cell       = static_cast<uint16_t>(i);
        s.row        = static_cast<uint16_t>(static_cast<int>(i) / cols);
        s.col        = static_cast<uint16_t>(static_cast<int>(i) % cols);
        s.frame_id   = frame_index;
        s.t_ms       = t_ms;
        s.confidence = clampf(conf, 0.0f, 1.0f);
        s.kind       = kind;
        s.path       = by_hold ? msg::TriggerPath::HOLD : msg::TriggerPath::ENERGY;

        cell.hold = 0;
        cell.below_low = false;
        cell.refractory = static_cast<uint8_t>(m_cfg.refractory_frames);
        bank.clearEnergy(i);
    }

    return count;
}

} // namespace det
