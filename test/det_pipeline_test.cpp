// test/det_pipeline_test.cpp
// Synthetic board: 2x2 cells on an 80x80 frame, one frame every 20 ms.

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/det/SequenceDetector.hpp"
#include "msg/ImageFrame.hpp"

using msg::RoundPhase;

namespace {

int g_failures = 0;

void check(bool ok, const char* what) {
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

constexpr int SIDE = 80;
constexpr uint64_t FRAME_MS = 20;
constexpr double BASE = 60.0;
constexpr double FLASH = 200.0;

struct Flash {
    int cell;
    uint64_t t_ms;
};

// Round 0: reveal 0,3,1 then the same three as input.
const Flash SCHEDULE[] = {
    {0, 1000}, {3, 1300}, {1, 1600},
    {0, 2500}, {3, 2800}, {1, 3100},
};

// Whole-screen brightness swell between 600 and 980 ms, peak +40.
double backgroundAt(uint64_t t) {
    if (t < 600 || t > 980) return BASE;
    const double d = std::fabs(static_cast<double>(t) - 790.0);
    return BASE + 40.0 * (1.0 - d / 190.0);
}

void render(cv::Mat& img, uint64_t t) {
    img.setTo(cv::Scalar::all(backgroundAt(t)));
    for (const Flash& f : SCHEDULE) {
        if (t >= f.t_ms && t < f.t_ms + 3 * FRAME_MS) {
            const int r = f.cell / 2;
            const int c = f.cell % 2;
            img(cv::Rect(c * SIDE / 2, r * SIDE / 2, SIDE / 2, SIDE / 2)).setTo(cv::Scalar::all(FLASH));
        }
    }
}

msg::ImageFrame wrap(const cv::Mat& m, uint64_t t, uint32_t id) {
    msg::ImageFrame f{};
    f.data = m.data;
    f.width = static_cast<uint32_t>(m.cols);
    f.height = static_cast<uint32_t>(m.rows);
    f.stride = static_cast<uint32_t>(m.step[0]);
    f.format = msg::PixelFormat::BGR8;
    f.t_capture_us = t * 1000;
    f.frame_id = id;
    return f;
}

} // namespace

int main() {
    std::cout << "=== DETECTION PIPELINE TEST ===\n";

    det::DetectorConfig cfg{};
    cfg.color_gate_enabled = false;
    cfg.calibration_window_ms = 500;

    det::SequenceDetector sd(cfg, Rect{0.0f, 0.0f, 1.0f, 1.0f}, GridConfig{2, 2});
    check(sd.bank().size() == 4, "bank sized for the grid");

    cv::Mat img(SIDE, SIDE, CV_8UC3);
    det::StepArray events{};

    // ---- Not started ----
    render(img, 0);
    check(sd.tick(wrap(img, 0, 0), 0, events) == 0 && sd.status().frame_index == 0, "stopped detector ignores frames");

    sd.start();
    sd.beginCalibration(0);
    check(sd.calibrating() && sd.status().calibrating, "calibration running");

    std::vector<msg::Step> seen;
    bool rearming_checked = false;
    bool calibrated_at_520 = false;
    uint32_t id = 1;

    for (uint64_t t = FRAME_MS; t <= 3400; t += FRAME_MS, ++id) {
        render(img, t);
        const std::size_t n = sd.tick(wrap(img, t, id), t, events);
        for (std::size_t i = 0; i < n; ++i) seen.push_back(events[i]);

        if (t == 520) {
            calibrated_at_520 = !sd.calibrating() && sd.takeCalibrationDone();
        }

        if (t == 3100) {
            const msg::RoundState& rs = sd.fsm().state();
            check(rs.phase == RoundPhase::REARMING, "inputs complete the round");
            check(rs.reveal_len == 3 && rs.input_progress == 3, "reveal 3, input 3");
            check(sd.fsm().sequenceText() == "r1c1 r2c2 r1c2 r1c1 r2c2 r1c2", "sequence recorded in order");
            rearming_checked = true;
        }
    }

    check(calibrated_at_520, "calibration window closed on the first frame past 500 ms");
    check(!sd.takeCalibrationDone(), "calibration completion reported once");
    check(std::fabs(sd.bank()[2].baseline - static_cast<float>(BASE)) < 1.0f, "baseline settles at the board level");
    check(rearming_checked, "round checkpoint reached");

    check(seen.size() == 6, "one event per flash, none from the brightness swell");
    if (seen.size() == 6) {
        bool ok = true;
        for (std::size_t i = 0; i < 6; ++i) {
            ok = ok && seen[i].cell == SCHEDULE[i].cell && seen[i].t_ms == SCHEDULE[i].t_ms;
        }
        check(ok, "events on the first frame of each flash, right cell");
    }

    check(sd.fsm().phase() == RoundPhase::ARMED, "next round armed after the rearm delay");
    check(sd.fsm().state().round_index == 1 && sd.fsm().steps().empty(), "round 1, history cleared");

    // ---- Status ----
    const msg::DetectorStatus st = sd.status();
    check(st.running && !st.calibrating && st.rows == 2 && st.cols == 2, "status shape");
    check(std::fabs(st.fps - 50.0f) < 0.5f, "fps from frame spacing");
    check(st.frame_index == id - 1, "every delivered frame ticked");

    // ---- Empty frame ----
    {
        const uint32_t revision = sd.fsm().revision();
        check(sd.tick(msg::ImageFrame{}, 3420, events) == 0, "empty frame yields nothing");
        check(sd.fsm().revision() == revision && sd.fsm().phase() == RoundPhase::ARMED, "empty frame changes nothing");
        check(!sd.lastCells().valid, "empty frame flagged as no signal");
    }

    // ---- Stop, reset, reconfigure ----
    sd.stop();
    render(img, 3440);
    check(sd.tick(wrap(img, 3440, id), 3440, events) == 0 && !sd.status().running, "stopped detector idles");

    sd.reset();
    check(sd.fsm().phase() == RoundPhase::IDLE && sd.status().frame_index == 0, "reset clears round and counters");
    check(std::fabs(sd.bank()[2].baseline - static_cast<float>(BASE)) < 1.0f, "reset keeps the calibrated baselines");

    sd.configure(Rect{0.0f, 0.0f, 1.0f, 1.0f}, GridConfig{3, 3}, cfg);
    check(sd.bank().size() == 9 && sd.status().rows == 3, "new grid rebuilds the bank");

    std::cout << (g_failures ? "DETECTION PIPELINE TEST FAILED\n" : "DETECTION PIPELINE TEST PASSED\n");
    return g_failures ? -1 : 0;
}
