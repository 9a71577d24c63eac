#include "apps/det/DetectorConfig.hpp"

namespace det {

static inline float clampf(float x, float lo, float hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

DetectorConfig sanitise(const DetectorConfig& in) {
    DetectorConfig cfg = in;

    // Hysteresis needs thr_high > thr_low >= 0.
    if (!(cfg.thr_low >= 0.0f)) cfg.thr_low = 0.0f;
    if (!(cfg.thr_high > cfg.thr_low)) cfg.thr_high = cfg.thr_low + 1.0f;

    if (cfg.hold_frames < 1) cfg.hold_frames = 1;
    if (cfg.hold_frames > 255) cfg.hold_frames = 255;          // fits the per-cell counter
    if (cfg.refractory_frames > 255) cfg.refractory_frames = 255;

    cfg.padding_pct = clampf(cfg.padding_pct, 0.0f, 90.0f);
    cfg.ema_alpha   = clampf(cfg.ema_alpha, 0.01f, 0.99f);

    if (cfg.energy_window < 2) cfg.energy_window = 2;
    if (cfg.energy_window > DetectorConfig::MAX_ENERGY_WINDOW)
        cfg.energy_window = DetectorConfig::MAX_ENERGY_WINDOW;
    if (!(cfg.energy_scale > 0.0f)) cfg.energy_scale = 1.0f;

    cfg.color_hue_tol_deg     = clampf(cfg.color_hue_tol_deg, 0.0f, 180.0f);
    cfg.color_sat_min         = clampf(cfg.color_sat_min, 0.0f, 1.0f);
    cfg.color_val_min         = clampf(cfg.color_val_min, 0.0f, 1.0f);
    cfg.color_min_frac_reveal = clampf(cfg.color_min_frac_reveal, 0.0f, 1.0f);
    cfg.color_min_frac_input  = clampf(cfg.color_min_frac_input, 0.0f, 1.0f);
    if (!(cfg.color_dominance_ratio >= 1.0f)) cfg.color_dominance_ratio = 1.0f;

    if (cfg.input_timeout_ms < DetectorConfig::MIN_INPUT_TIMEOUT_MS)
        cfg.input_timeout_ms = DetectorConfig::MIN_INPUT_TIMEOUT_MS;
    if (cfg.initial_reveal_len < 1) cfg.initial_reveal_len = 1;

    if (cfg.calibration_window_ms < 50) cfg.calibration_window_ms = 50;
    if (cfg.calibration_window_ms > 10000) cfg.calibration_window_ms = 10000;

    return cfg;
}

} // namespace det
