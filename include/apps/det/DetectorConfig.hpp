#pragma once
#include <cstdint>

#include "types.hpp"

namespace det {

// STRICT : a cell retriggers only after its cooldown has run out AND it has
//          dropped below thr_low at least once.
// RELAXED: dropping below thr_low re-arms the cell even mid-cooldown.
enum class RefractoryPolicy : uint8_t { STRICT = 0, RELAXED = 1 };

// ---------------------------------------------------------------------------
// Configuration for the whole detection pipeline (tunable parameters, no state).
// Treated as immutable for the duration of one tick; swap it only between
// frames. Every field has a default, run it through sanitise() before use.
// ---------------------------------------------------------------------------
struct DetectorConfig {
    // ---- Signal / hysteresis ----
    float    thr_high          = 10.0f;   // trigger level of smoothed delta [luma]
    float    thr_low           = 6.0f;    // re-arm level [luma]
    uint16_t hold_frames       = 1;       // consecutive ticks >= thr_high
    uint16_t refractory_frames = 6;       // cooldown after an event [ticks]
    RefractoryPolicy refractory_policy = RefractoryPolicy::STRICT;

    float padding_pct = 16.0f;            // cell interior margin [% of cell size]
    float ema_alpha   = 0.20f;            // baseline and delta smoothing

    // ---- Quick-flash energy path ----
    bool     quick_flash_enabled = true;
    uint16_t energy_window       = 5;     // ring length [ticks], 2..MAX_ENERGY_WINDOW
    float    energy_scale        = 2.5f;  // energy threshold = (thr_high - thr_low) * scale

    // ---- Colour gate ----
    bool  color_gate_enabled    = true;
    Rgb8  color_reveal          = {0x1a, 0xa0, 0x85};
    Rgb8  color_input           = {0x27, 0xad, 0x61};
    float color_hue_tol_deg     = 40.0f;
    float color_sat_min         = 0.15f;  // 0..1
    float color_val_min         = 0.15f;  // 0..1
    float color_min_frac_reveal = 0.002f; // 0..1 of sampled pixels
    float color_min_frac_input  = 0.002f;
    float color_dominance_ratio = 1.5f;   // a fraction must beat the other by this to decide the kind

    // ---- Round FSM timing ----
    uint32_t reveal_max_isi_ms = 900;     // event gap that ends the reveal
    uint32_t cluster_gap_ms    = 900;     // silence that closes the reveal cluster
    uint32_t input_timeout_ms  = 12000;   // waiting-input failsafe (never below MIN_INPUT_TIMEOUT_MS)
    uint32_t rearm_delay_ms    = 120;

    bool     use_expected_reveal_len = true;
    uint16_t initial_reveal_len      = 3;     // expected reveal length of round 0
    uint32_t reveal_hard_timeout_ms  = 1800;

    bool auto_round_detect    = true;     // first event in IDLE arms the FSM
    bool append_across_rounds = false;    // keep steps of previous rounds

    // ---- Calibration ----
    uint32_t calibration_window_ms = 500;

    static constexpr uint16_t MAX_ENERGY_WINDOW   = 16;
    static constexpr uint32_t MIN_INPUT_TIMEOUT_MS = 2000;
};

// Clamp user-tunable edge values instead of rejecting them.
DetectorConfig sanitise(const DetectorConfig& in);

} // namespace det
