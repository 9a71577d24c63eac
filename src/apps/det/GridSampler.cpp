#include "apps/det/GridSampler.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace det {

static inline int clampi(int x, int lo, int hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

Hsv rgbToHsv(uint8_t r8, uint8_t g8, uint8_t b8) {
    const float r = r8 / 255.0f;
    const float g = g8 / 255.0f;
    const float b = b8 / 255.0f;

    const float mx = std::max(r, std::max(g, b));
    const float mn = std::min(r, std::min(g, b));
    const float d  = mx - mn;

    float h = 0.0f;
    if (d > 0.0f) {
        if (mx == r)      h = std::fmod((g - b) / d, 6.0f);
        else if (mx == g) h = (b - r) / d + 2.0f;
        else              h = (r - g) / d + 4.0f;
        h *= 60.0f;
        if (h < 0.0f) h += 360.0f;
    }
    const float s = (mx == 0.0f) ? 0.0f : d / mx;
    return {h, s, mx};
}

float hueDistDeg(float a, float b) {
    const float d = std::fmod(std::fabs(a - b), 360.0f);
    return d > 180.0f ? 360.0f - d : d;
}

ColorTargets makeColorTargets(const DetectorConfig& cfg) {
    ColorTargets t;
    t.reveal_hue_deg = rgbToHsv(cfg.color_reveal.r, cfg.color_reveal.g, cfg.color_reveal.b).h;
    t.input_hue_deg  = rgbToHsv(cfg.color_input.r, cfg.color_input.g, cfg.color_input.b).h;
    t.hue_tol_deg    = cfg.color_hue_tol_deg;
    t.sat_min        = cfg.color_sat_min;
    t.val_min        = cfg.color_val_min;
    return t;
}

bool GridSampler::sample(const msg::ImageFrame& img, const Rect& roi, const GridConfig& grid,
                         float padding_pct, msg::CellFrame& out) {
    return sampleImpl(img, roi, grid, padding_pct, nullptr, out);
}

bool GridSampler::sample(const msg::ImageFrame& img, const Rect& roi, const GridConfig& grid,
                         float padding_pct, const ColorTargets& color, msg::CellFrame& out) {
    return sampleImpl(img, roi, grid, padding_pct, &color, out);
}

void GridSampler::clearFrame(const GridConfig& grid, msg::CellFrame& out) {
    const int rows = clampi(grid.rows, 1, msg::MAX_GRID_DIM);
    const int cols = clampi(grid.cols, 1, msg::MAX_GRID_DIM);

    out.rows = static_cast<uint16_t>(rows);
    out.cols = static_cast<uint16_t>(cols);
    out.cell_count = static_cast<uint16_t>(rows * cols);
    out.valid = 0;
    out.has_color = 0;

    std::fill(out.luma.begin(), out.luma.end(), 0.0f);
    std::fill(out.reveal_frac.begin(), out.reveal_frac.end(), 0.0f);
    std::fill(out.input_frac.begin(), out.input_frac.end(), 0.0f);
}

bool GridSampler::prepareWorkImage(const msg::ImageFrame& img, const Rect& roi, cv::Mat& work) {
    if (!img.hasPixels()) return false;

    const int bpp = msg::bytesPerPixel(img.format);
    const int w = static_cast<int>(img.width);
    const int h = static_cast<int>(img.height);
    if (img.stride < img.width * static_cast<uint32_t>(bpp)) return false;

    // Normalised ROI -> absolute pixel bounds, clamped to the frame.
    const int rx = clampi(static_cast<int>(std::lround(roi.x * w)), 0, w - 1);
    const int ry = clampi(static_cast<int>(std::lround(roi.y * h)), 0, h - 1);
    const int rw = std::min(static_cast<int>(std::lround(roi.width * w)), w - rx);
    const int rh = std::min(static_cast<int>(std::lround(roi.height * h)), h - ry);
    if (rw < 1 || rh < 1) return false;

    const int type = (img.format == msg::PixelFormat::GRAY8) ? CV_8UC1
                   : (img.format == msg::PixelFormat::BGRA8) ? CV_8UC4
                   : CV_8UC3;

    // Header only, no copy. The frame buffer is read-only for us.
    const cv::Mat src(h, w, type, const_cast<uint8_t*>(img.data), img.stride);
    const cv::Mat roi_view = src(cv::Rect(rx, ry, rw, rh));

    // Bound per-frame cost independently of the capture resolution.
    cv::Mat scaled = roi_view;
    const int longer = std::max(rw, rh);
    if (longer > MAX_WORK_SIDE) {
        const double s = static_cast<double>(MAX_WORK_SIDE) / longer;
        const int dw = std::max(1, static_cast<int>(std::lround(rw * s)));
        const int dh = std::max(1, static_cast<int>(std::lround(rh * s)));
        cv::resize(roi_view, m_scaled, cv::Size(dw, dh), 0.0, 0.0, cv::INTER_AREA);
        scaled = m_scaled;
    }

    if (type == CV_8UC3) {
        work = scaled;
    } else if (type == CV_8UC4) {
        cv::cvtColor(scaled, m_bgr, cv::COLOR_BGRA2BGR);
        work = m_bgr;
    } else {
        cv::cvtColor(scaled, m_bgr, cv::COLOR_GRAY2BGR);
        work = m_bgr;
    }

    m_work_w = work.cols;
    m_work_h = work.rows;
    return true;
}

bool GridSampler::sampleImpl(const msg::ImageFrame& img, const Rect& roi, const GridConfig& grid,
                             float padding_pct, const ColorTargets* color, msg::CellFrame& out) {
    clearFrame(grid, out);
    out.t_capture_us = img.t_capture_us;
    out.frame_id     = img.frame_id;

    cv::Mat work;
    if (!prepareWorkImage(img, roi, work)) {
        // No signal this tick, not an error.
        return false;
    }

    const int rows = out.rows;
    const int cols = out.cols;
    const int width  = work.cols;
    const int height = work.rows;

    const float cell_w = static_cast<float>(width) / cols;
    const float cell_h = static_cast<float>(height) / rows;
    const float pad_x  = (padding_pct / 100.0f) * cell_w * 0.5f;
    const float pad_y  = (padding_pct / 100.0f) * cell_h * 0.5f;

    // ~SAMPLES_PER_SIDE samples across the shorter cell side is plenty.
    const int step = std::max(1, static_cast<int>(std::floor(std::min(cell_w, cell_h) / SAMPLES_PER_SIDE)));

    for (int r = 0; r < rows; ++r) {
        const int y0 = clampi(static_cast<int>(std::floor(r * cell_h + pad_y)), 0, height);
        const int y1 = clampi(static_cast<int>(std::ceil((r + 1) * cell_h - pad_y)), 0, height);

        for (int c = 0; c < cols; ++c) {
            const int idx = r * cols + c;
            const int x0 = clampi(static_cast<int>(std::floor(c * cell_w + pad_x)), 0, width);
            const int x1 = clampi(static_cast<int>(std::ceil((c + 1) * cell_w - pad_x)), 0, width);

            float sum = 0.0f;
            int cnt = 0;
            int hit_reveal = 0;
            int hit_input = 0;

            for (int y = y0; y < y1; y += step) {
                const uint8_t* row_ptr = work.ptr<uint8_t>(y);
                for (int x = x0; x < x1; x += step) {
                    const uint8_t* px = row_ptr + 3 * x;   // B, G, R
                    const uint8_t b8 = px[0];
                    const uint8_t g8 = px[1];
                    const uint8_t r8 = px[2];

                    sum += luminance(r8, g8, b8);
                    ++cnt;

                    if (color) {
                        const Hsv hsv = rgbToHsv(r8, g8, b8);
                        if (hsv.s >= color->sat_min && hsv.v >= color->val_min) {
                            // A pixel may match both targets; resolved downstream.
                            if (hueDistDeg(hsv.h, color->reveal_hue_deg) <= color->hue_tol_deg) ++hit_reveal;
                            if (hueDistDeg(hsv.h, color->input_hue_deg)  <= color->hue_tol_deg) ++hit_input;
                        }
                    }
                }
            }

            out.luma[idx] = cnt ? sum / cnt : 0.0f;
            if (color) {
                const float denom = static_cast<float>(std::max(1, cnt));
                out.reveal_frac[idx] = hit_reveal / denom;
                out.input_frac[idx]  = hit_input / denom;
            }
        }
    }

    out.valid = 1;
    out.has_color = color ? 1 : 0;
    return true;
}

} // namespace det
