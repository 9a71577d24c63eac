// test/det_gridsampler_test.cpp

#include <cmath>
#include <iostream>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "apps/det/GridSampler.hpp"
#include "msg/ImageFrame.hpp"
#include "msg/CellFrame.hpp"

namespace {

int g_failures = 0;

void check(bool ok, const char* what) {
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

bool near(float a, float b, float tol) { return std::fabs(a - b) <= tol; }

msg::ImageFrame wrap(const cv::Mat& m) {
    msg::ImageFrame f{};
    f.data   = m.data;
    f.width  = static_cast<uint32_t>(m.cols);
    f.height = static_cast<uint32_t>(m.rows);
    f.stride = static_cast<uint32_t>(m.step[0]);
    f.format = m.channels() == 1 ? msg::PixelFormat::GRAY8
             : m.channels() == 4 ? msg::PixelFormat::BGRA8
             : msg::PixelFormat::BGR8;
    return f;
}

const Rect FULL{0.0f, 0.0f, 1.0f, 1.0f};

} // namespace

int main() {
    std::cout << "=== GRID SAMPLER TEST ===\n";

    det::GridSampler sampler;
    msg::CellFrame out{};

    // ---- Luminance per cell, row-major ----
    {
        cv::Mat img(80, 80, CV_8UC3, cv::Scalar(0, 0, 0));
        img(cv::Rect(40, 0, 40, 40)).setTo(cv::Scalar(255, 255, 255));   // r0 c1
        img(cv::Rect(0, 40, 40, 40)).setTo(cv::Scalar(0, 255, 0));       // r1 c0, pure green

        const bool ok = sampler.sample(wrap(img), FULL, GridConfig{2, 2}, 16.0f, out);
        check(ok && out.valid, "BGR frame sampled");
        check(out.rows == 2 && out.cols == 2 && out.cell_count == 4, "grid shape copied");
        check(near(out.luma[0], 0.0f, 0.01f), "black cell reads 0");
        check(near(out.luma[1], 255.0f, 0.1f), "white cell reads 255");
        check(near(out.luma[2], 0.7152f * 255.0f, 0.1f), "green cell uses Rec.709 weight");
        check(!out.has_color, "luminance-only sample has no colour");
    }

    // ---- Padding keeps cell borders out ----
    {
        cv::Mat img(100, 100, CV_8UC1, cv::Scalar(100));
        // 4 px bright frame around each of the 2x2 cells
        for (int i = 0; i < 2; ++i) {
            cv::rectangle(img, cv::Rect(i * 50, 0, 50, 100), cv::Scalar(250), 4);
            cv::rectangle(img, cv::Rect(0, i * 50, 100, 50), cv::Scalar(250), 4);
        }
        sampler.sample(wrap(img), FULL, GridConfig{2, 2}, 40.0f, out);
        check(out.valid && near(out.luma[3], 100.0f, 0.01f), "padded interior ignores grid lines");
    }

    // ---- ROI maps to pixel bounds ----
    {
        cv::Mat img(100, 200, CV_8UC3, cv::Scalar(10, 10, 10));
        img(cv::Rect(100, 0, 100, 100)).setTo(cv::Scalar(200, 200, 200));
        const Rect right_half{0.5f, 0.0f, 0.5f, 1.0f};
        sampler.sample(wrap(img), right_half, GridConfig{1, 1}, 16.0f, out);
        check(out.valid && near(out.luma[0], 200.0f, 0.01f), "ROI restricts sampling to the right half");
    }

    // ---- Large frames are downsampled ----
    {
        cv::Mat img(720, 1280, CV_8UC4, cv::Scalar(50, 50, 50, 255));
        sampler.sample(wrap(img), FULL, GridConfig{6, 6}, 16.0f, out);
        check(out.valid, "BGRA frame sampled");
        check(sampler.workWidth() == det::GridSampler::MAX_WORK_SIDE, "longer side capped");
        check(sampler.workHeight() == 270, "aspect ratio kept when downsampling");
        check(near(out.luma[35], 50.0f, 0.5f), "uniform frame reads uniform luma");
    }

    // ---- No signal ----
    {
        msg::ImageFrame empty{};
        check(!sampler.sample(empty, FULL, GridConfig{3, 3}, 16.0f, out), "empty frame is no signal");
        check(!out.valid && out.cell_count == 9 && out.luma[4] == 0.0f, "no-signal frame is all zero");

        cv::Mat img(10, 10, CV_8UC3, cv::Scalar(255, 255, 255));
        const Rect degenerate{0.5f, 0.5f, 0.0f, 0.0f};
        check(!sampler.sample(wrap(img), degenerate, GridConfig{2, 2}, 16.0f, out), "zero-size ROI is no signal");
    }

    // ---- Colour fractions ----
    {
        det::DetectorConfig cfg{};
        cfg.color_reveal = {0, 0, 255};   // blue, hue 240
        cfg.color_input  = {255, 0, 0};   // red, hue 0
        const det::ColorTargets targets = det::makeColorTargets(cfg);
        check(near(targets.reveal_hue_deg, 240.0f, 0.01f) && near(targets.input_hue_deg, 0.0f, 0.01f),
              "target hues resolved from rgb");

        cv::Mat img(40, 120, CV_8UC3, cv::Scalar(0, 0, 0));
        img(cv::Rect(0, 0, 40, 40)).setTo(cv::Scalar(255, 0, 0));     // BGR: blue
        img(cv::Rect(40, 0, 40, 40)).setTo(cv::Scalar(0, 0, 255));    // BGR: red
        img(cv::Rect(80, 0, 40, 40)).setTo(cv::Scalar(40, 40, 40));   // grey, no saturation

        sampler.sample(wrap(img), FULL, GridConfig{1, 3}, 16.0f, targets, out);
        check(out.valid && out.has_color, "colour sample flagged");
        check(near(out.reveal_frac[0], 1.0f, 0.001f) && out.input_frac[0] == 0.0f, "blue cell is reveal colour");
        check(near(out.input_frac[1], 1.0f, 0.001f) && out.reveal_frac[1] == 0.0f, "red cell is input colour");
        check(out.reveal_frac[2] == 0.0f && out.input_frac[2] == 0.0f, "unsaturated cell matches nothing");
    }

    // ---- HSV helpers ----
    {
        const det::Hsv red = det::rgbToHsv(255, 0, 0);
        const det::Hsv teal = det::rgbToHsv(0x1a, 0xa0, 0x85);
        check(near(red.h, 0.0f, 0.01f) && near(red.s, 1.0f, 0.001f) && near(red.v, 1.0f, 0.001f), "red is h0 s1 v1");
        check(near(teal.h, 167.9f, 0.2f), "teal hue");
        check(near(det::hueDistDeg(350.0f, 10.0f), 20.0f, 0.001f), "hue distance wraps");
        check(near(det::hueDistDeg(0.0f, 180.0f), 180.0f, 0.001f), "hue distance caps at 180");
    }

    std::cout << (g_failures ? "GRID SAMPLER TEST FAILED\n" : "GRID SAMPLER TEST PASSED\n");
    return g_failures ? -1 : 0;
}
