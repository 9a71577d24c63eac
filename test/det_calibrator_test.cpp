// test/det_calibrator_test.cpp

#include <cmath>
#include <iostream>

#include "apps/det/Calibrator.hpp"
#include "apps/det/CellBank.hpp"
#include "msg/CellFrame.hpp"

namespace {

int g_failures = 0;

void check(bool ok, const char* what) {
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

msg::CellFrame frame(float luma, int cells, bool valid) {
    msg::CellFrame f{};
    f.rows = 2;
    f.cols = static_cast<uint16_t>(cells / 2);
    f.cell_count = static_cast<uint16_t>(cells);
    f.valid = valid ? 1 : 0;
    for (int i = 0; i < cells; ++i) f.luma[i] = luma;
    return f;
}

} // namespace

int main() {
    std::cout << "=== CALIBRATOR TEST ===\n";

    // ---- Window mean seeds the baselines ----
    {
        det::CellBank bank;
        bank.reshape(GridConfig{2, 2}, 5);
        bank[1].delta_smooth = 25.0f;
        bank[1].refractory = 4;

        det::Calibrator cal;
        check(!cal.feed(frame(80.0f, 4, true), 0), "feed before begin is ignored");

        cal.begin(1000, 500, bank.size());
        check(cal.active(), "window open");

        bool done = false;
        uint64_t t = 1000;
        for (int k = 0; !done && k < 100; ++k, t += 33) {
            done = cal.feed(frame(80.0f, 4, true), t);
            // noise that must not be counted
            if (!done) done = cal.feed(frame(999.0f, 4, false), t);
            if (!done) done = cal.feed(frame(999.0f, 2, true), t);
        }

        check(done, "window elapses");
        check(t - 33 > 1500 && t - 33 <= 1533, "window ends on the first frame past its length");
        check(cal.frameCount() == 17, "invalid and mismatched frames are skipped");

        cal.apply(bank);
        check(!cal.active(), "apply closes the window");
        check(std::fabs(bank[0].baseline - 80.0f) < 1e-3f && std::fabs(bank[3].baseline - 80.0f) < 1e-3f,
              "baselines converge to the window mean");
        check(bank[1].delta_smooth == 0.0f && bank[1].refractory == 0 && bank[1].below_low,
              "trigger state cleared and re-armed");
    }

    // ---- No frames: the poll path ends the window ----
    {
        det::CellBank bank;
        bank.reshape(GridConfig{2, 2}, 5);
        bank[0].baseline = 42.0f;

        det::Calibrator cal;
        cal.begin(5000, 200, bank.size());
        check(!cal.poll(5100), "poll before the window ends");
        check(!cal.poll(5200), "window length itself is not past");
        check(cal.poll(5201), "poll after the window ends");

        cal.apply(bank);
        check(bank[0].baseline == 0.0f && cal.frameCount() == 0, "empty window zeroes the baselines");
    }

    // ---- Cancel ----
    {
        det::Calibrator cal;
        cal.begin(0, 100, 4);
        cal.cancel();
        check(!cal.active() && !cal.poll(1000), "cancelled window never completes");
    }

    std::cout << (g_failures ? "CALIBRATOR TEST FAILED\n" : "CALIBRATOR TEST PASSED\n");
    return g_failures ? -1 : 0;
}
