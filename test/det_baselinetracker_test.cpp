// test/det_baselinetracker_test.cpp

#include <cmath>
#include <iostream>

#include "apps/det/BaselineTracker.hpp"
#include "apps/det/CellBank.hpp"
#include "msg/CellFrame.hpp"

namespace {

int g_failures = 0;

void check(bool ok, const char* what) {
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

bool near(float a, float b, float tol) { return std::fabs(a - b) <= tol; }

msg::CellFrame uniform(float luma, int cells) {
    msg::CellFrame f{};
    f.rows = 1;
    f.cols = static_cast<uint16_t>(cells);
    f.cell_count = static_cast<uint16_t>(cells);
    f.valid = 1;
    for (int i = 0; i < cells; ++i) f.luma[i] = luma;
    return f;
}

} // namespace

int main() {
    std::cout << "=== BASELINE TRACKER TEST ===\n";

    // ---- Median ----
    {
        float odd[]  = {3.0f, 1.0f, 2.0f};
        float even[] = {4.0f, 1.0f, 3.0f, 2.0f};
        float one[]  = {-7.5f};
        check(det::BaselineTracker::median(odd, 3) == 2.0f, "median of an odd count");
        check(det::BaselineTracker::median(even, 4) == 2.5f, "median of an even count is the mean of the middle pair");
        check(det::BaselineTracker::median(one, 1) == -7.5f, "median of a single value");
        check(det::BaselineTracker::median(nullptr, 0) == 0.0f, "median of nothing is 0");
    }

    det::DetectorConfig cfg{};
    cfg.ema_alpha = 0.2f;
    det::BaselineTracker tracker(cfg);

    // ---- Whole-screen drift is cancelled ----
    {
        det::CellBank bank;
        bank.reshape(GridConfig{2, 2}, 5);
        for (std::size_t i = 0; i < bank.size(); ++i) bank[i].baseline = 100.0f;

        det::TrackOutput tout{};
        float worst = 0.0f;
        for (int k = 0; k < 60; ++k) {
            msg::CellFrame f = uniform(100.0f + 1.5f * k, 4);   // slow global brightening
            tracker.update(f, bank, tout);
            for (std::size_t i = 0; i < bank.size(); ++i) {
                worst = std::max(worst, std::fabs(bank[i].delta_smooth));
            }
        }
        check(worst < 1e-4f, "global ramp leaves delta_smooth at zero");
        check(tout.median_delta > 1.0f, "ramp shows up in the median instead");
        check(bank[0].baseline > 100.0f, "baselines follow the ramp");
    }

    // ---- A single flashing cell stands out ----
    {
        det::CellBank bank;
        bank.reshape(GridConfig{2, 2}, 5);
        for (std::size_t i = 0; i < bank.size(); ++i) bank[i].baseline = 100.0f;

        msg::CellFrame f = uniform(100.0f, 4);
        f.luma[2] = 160.0f;

        det::TrackOutput tout{};
        tracker.update(f, bank, tout);

        // baseline 112, raw delta 48, median of {0,0,0,48} is 0
        check(near(bank[2].baseline, 112.0f, 1e-3f), "baseline moves by alpha");
        check(near(bank[2].delta_smooth, 9.6f, 1e-3f), "delta_smooth moves by alpha of the corrected delta");
        check(bank[0].delta_smooth == 0.0f && bank[3].delta_smooth == 0.0f, "steady cells stay at zero");
        check(tout.hot_index == 2 && near(tout.hot_value, 9.6f, 1e-3f), "flashing cell is the hot cell");
        check(tout.median_delta == 0.0f, "one outlier does not move the median");
    }

    // ---- Frame and bank disagree on size ----
    {
        det::CellBank bank;
        bank.reshape(GridConfig{2, 2}, 5);
        msg::CellFrame f = uniform(50.0f, 2);

        det::TrackOutput tout{};
        tracker.update(f, bank, tout);
        check(bank[1].baseline > 0.0f && bank[2].baseline == 0.0f, "only the overlapping cells update");
    }

    std::cout << (g_failures ? "BASELINE TRACKER TEST FAILED\n" : "BASELINE TRACKER TEST PASSED\n");
    return g_failures ? -1 : 0;
}
