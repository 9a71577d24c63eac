#include "core/Settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>

#include <opencv2/core.hpp>

namespace core {

namespace {

const char* const DIFFICULTY_KEYS[DIFFICULTY_COUNT] = {"easy", "medium", "hard", "expert"};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isNumber(const cv::FileNode& n) { return n.isReal() || n.isInt(); }

void readFloat(const cv::FileNode& parent, const char* key, float& v) {
    const cv::FileNode n = parent[key];
    if (isNumber(n)) v = static_cast<float>(static_cast<double>(n));
}

void readU16(const cv::FileNode& parent, const char* key, uint16_t& v) {
    const cv::FileNode n = parent[key];
    if (!isNumber(n)) return;
    const double d = static_cast<double>(n);
    v = static_cast<uint16_t>(std::max(0.0, std::min(65535.0, d)));
}

void readU32(const cv::FileNode& parent, const char* key, uint32_t& v) {
    const cv::FileNode n = parent[key];
    if (!isNumber(n)) return;
    const double d = static_cast<double>(n);
    v = static_cast<uint32_t>(std::max(0.0, std::min(4294967295.0, d)));
}

void readBool(const cv::FileNode& parent, const char* key, bool& v) {
    const cv::FileNode n = parent[key];
    if (isNumber(n)) v = static_cast<int>(n) != 0;
    else if (n.isString()) {
        const std::string s = lower(static_cast<std::string>(n));
        if (s == "true" || s == "yes" || s == "on") v = true;
        else if (s == "false" || s == "no" || s == "off") v = false;
    }
}

void readString(const cv::FileNode& parent, const char* key, std::string& v) {
    const cv::FileNode n = parent[key];
    if (n.isString()) v = static_cast<std::string>(n);
}

void readColor(const cv::FileNode& parent, const char* key, Rgb8& v) {
    const cv::FileNode n = parent[key];
    if (!n.isString()) return;
    Rgb8 parsed{};
    if (parseHexColor(static_cast<std::string>(n), parsed)) {
        v = parsed;
    } else {
        std::cerr << "[Settings] ignoring bad colour for '" << key << "'\n";
    }
}

void readRect(const cv::FileNode& n, Rect& r) {
    if (!n.isMap()) return;
    readFloat(n, "x", r.x);
    readFloat(n, "y", r.y);
    readFloat(n, "width", r.width);
    readFloat(n, "height", r.height);
}

void readDetector(const cv::FileNode& n, det::DetectorConfig& c) {
    if (!n.isMap()) return;

    readFloat(n, "thr_high", c.thr_high);
    readFloat(n, "thr_low", c.thr_low);
    readU16(n, "hold_frames", c.hold_frames);
    readU16(n, "refractory_frames", c.refractory_frames);

    std::string policy;
    readString(n, "refractory_policy", policy);
    policy = lower(policy);
    if (policy == "strict") c.refractory_policy = det::RefractoryPolicy::STRICT;
    else if (policy == "relaxed") c.refractory_policy = det::RefractoryPolicy::RELAXED;

    readFloat(n, "padding_pct", c.padding_pct);
    readFloat(n, "ema_alpha", c.ema_alpha);

    readBool(n, "quick_flash_enabled", c.quick_flash_enabled);
    readU16(n, "energy_window", c.energy_window);
    readFloat(n, "energy_scale", c.energy_scale);

    readBool(n, "color_gate_enabled", c.color_gate_enabled);
    readColor(n, "color_reveal", c.color_reveal);
    readColor(n, "color_input", c.color_input);
    readFloat(n, "color_hue_tol_deg", c.color_hue_tol_deg);
    readFloat(n, "color_sat_min", c.color_sat_min);
    readFloat(n, "color_val_min", c.color_val_min);
    readFloat(n, "color_min_frac_reveal", c.color_min_frac_reveal);
    readFloat(n, "color_min_frac_input", c.color_min_frac_input);
    readFloat(n, "color_dominance_ratio", c.color_dominance_ratio);

    readU32(n, "reveal_max_isi_ms", c.reveal_max_isi_ms);
    readU32(n, "cluster_gap_ms", c.cluster_gap_ms);
    readU32(n, "input_timeout_ms", c.input_timeout_ms);
    readU32(n, "rearm_delay_ms", c.rearm_delay_ms);

    readBool(n, "use_expected_reveal_len", c.use_expected_reveal_len);
    readU16(n, "initial_reveal_len", c.initial_reveal_len);
    readU32(n, "reveal_hard_timeout_ms", c.reveal_hard_timeout_ms);

    readBool(n, "auto_round_detect", c.auto_round_detect);
    readBool(n, "append_across_rounds", c.append_across_rounds);

    readU32(n, "calibration_window_ms", c.calibration_window_ms);
}

void writeRect(cv::FileStorage& fs, const char* key, const Rect& r) {
    fs << key << "{";
    fs << "x" << r.x << "y" << r.y << "width" << r.width << "height" << r.height;
    fs << "}";
}

void writeDetector(cv::FileStorage& fs, const det::DetectorConfig& c) {
    fs << "detector" << "{";
    fs << "thr_high" << c.thr_high;
    fs << "thr_low" << c.thr_low;
    fs << "hold_frames" << static_cast<int>(c.hold_frames);
    fs << "refractory_frames" << static_cast<int>(c.refractory_frames);
    fs << "refractory_policy"
       << (c.refractory_policy == det::RefractoryPolicy::RELAXED ? "relaxed" : "strict");
    fs << "padding_pct" << c.padding_pct;
    fs << "ema_alpha" << c.ema_alpha;

    fs << "quick_flash_enabled" << static_cast<int>(c.quick_flash_enabled);
    fs << "energy_window" << static_cast<int>(c.energy_window);
    fs << "energy_scale" << c.energy_scale;

    fs << "color_gate_enabled" << static_cast<int>(c.color_gate_enabled);
    fs << "color_reveal" << toHexColor(c.color_reveal);
    fs << "color_input" << toHexColor(c.color_input);
    fs << "color_hue_tol_deg" << c.color_hue_tol_deg;
    fs << "color_sat_min" << c.color_sat_min;
    fs << "color_val_min" << c.color_val_min;
    fs << "color_min_frac_reveal" << c.color_min_frac_reveal;
    fs << "color_min_frac_input" << c.color_min_frac_input;
    fs << "color_dominance_ratio" << c.color_dominance_ratio;

    fs << "reveal_max_isi_ms" << static_cast<double>(c.reveal_max_isi_ms);
    fs << "cluster_gap_ms" << static_cast<double>(c.cluster_gap_ms);
    fs << "input_timeout_ms" << static_cast<double>(c.input_timeout_ms);
    fs << "rearm_delay_ms" << static_cast<double>(c.rearm_delay_ms);

    fs << "use_expected_reveal_len" << static_cast<int>(c.use_expected_reveal_len);
    fs << "initial_reveal_len" << static_cast<int>(c.initial_reveal_len);
    fs << "reveal_hard_timeout_ms" << static_cast<double>(c.reveal_hard_timeout_ms);

    fs << "auto_round_detect" << static_cast<int>(c.auto_round_detect);
    fs << "append_across_rounds" << static_cast<int>(c.append_across_rounds);

    fs << "calibration_window_ms" << static_cast<double>(c.calibration_window_ms);
    fs << "}";
}

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// -------------------- presets --------------------

GridConfig gridForDifficulty(Difficulty d) {
    switch (d) {
        case Difficulty::EASY:   return {4, 4};
        case Difficulty::MEDIUM: return {5, 5};
        case Difficulty::HARD:   return {6, 6};
        case Difficulty::EXPERT: return {6, 6};
        default:                 return {6, 6};
    }
}

det::DetectorConfig detectorForDifficulty(Difficulty) {
    // One profile fits every board size so far.
    return det::DetectorConfig{};
}

const char* DifficultyStr(Difficulty d) {
    const std::size_t i = static_cast<std::size_t>(d);
    return i < DIFFICULTY_COUNT ? DIFFICULTY_KEYS[i] : "unknown";
}

bool parseDifficulty(const std::string& s, Difficulty& out) {
    const std::string key = lower(s);
    for (std::size_t i = 0; i < DIFFICULTY_COUNT; ++i) {
        if (key == DIFFICULTY_KEYS[i]) {
            out = static_cast<Difficulty>(i);
            return true;
        }
    }
    return false;
}

GridConfig Settings::grid() const {
    return gridForDifficulty(difficulty);
}

// -------------------- field helpers --------------------

static inline float clampf(float x, float lo, float hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

Rect sanitiseRoi(const Rect& in) {
    Rect r;
    // NaN falls through both comparisons of clampf; pin it first.
    r.x      = (in.x == in.x) ? clampf(in.x, 0.0f, 1.0f) : 0.0f;
    r.y      = (in.y == in.y) ? clampf(in.y, 0.0f, 1.0f) : 0.0f;
    r.width  = (in.width == in.width) ? clampf(in.width, ROI_MIN_SIDE, 1.0f) : 1.0f;
    r.height = (in.height == in.height) ? clampf(in.height, ROI_MIN_SIDE, 1.0f) : 1.0f;
    if (r.x + r.width > 1.0f)  r.x = 1.0f - r.width;
    if (r.y + r.height > 1.0f) r.y = 1.0f - r.height;
    return r;
}

bool parseRoi(const std::string& s, Rect& out) {
    float v[4];
    char tail = 0;
    if (std::sscanf(s.c_str(), "%f,%f,%f,%f%c", &v[0], &v[1], &v[2], &v[3], &tail) != 4) {
        return false;
    }
    out.x = v[0];
    out.y = v[1];
    out.width = v[2];
    out.height = v[3];
    return true;
}

bool parseHexColor(const std::string& s, Rgb8& out) {
    std::string h = s;
    if (!h.empty() && h[0] == '#') h.erase(0, 1);

    int n[6];
    if (h.size() == 3) {
        for (int i = 0; i < 3; ++i) {
            n[i] = hexNibble(h[i]);
            if (n[i] < 0) return false;
        }
        out.r = static_cast<uint8_t>(n[0] * 17);
        out.g = static_cast<uint8_t>(n[1] * 17);
        out.b = static_cast<uint8_t>(n[2] * 17);
        return true;
    }
    if (h.size() == 6) {
        for (int i = 0; i < 6; ++i) {
            n[i] = hexNibble(h[i]);
            if (n[i] < 0) return false;
        }
        out.r = static_cast<uint8_t>(n[0] * 16 + n[1]);
        out.g = static_cast<uint8_t>(n[2] * 16 + n[3]);
        out.b = static_cast<uint8_t>(n[4] * 16 + n[5]);
        return true;
    }
    return false;
}

std::string toHexColor(const Rgb8& c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
    return buf;
}

// -------------------- persistence --------------------

const char* SettingsStatusStr(SettingsStatus s) {
    switch (s) {
        case SettingsStatus::OK:                  return "OK";
        case SettingsStatus::OPEN_FAIL:           return "OPEN_FAIL";
        case SettingsStatus::PARSE_FAIL:          return "PARSE_FAIL";
        case SettingsStatus::VERSION_UNSUPPORTED: return "VERSION_UNSUPPORTED";
        case SettingsStatus::WRITE_FAIL:          return "WRITE_FAIL";
        default:                                  return "UNKNOWN";
    }
}

SettingsStatus loadSettings(const std::string& path, Settings& inout) {
    Settings s = inout;

    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) return SettingsStatus::OPEN_FAIL;

        const cv::FileNode root = fs.root();
        if (!root.isMap()) return SettingsStatus::PARSE_FAIL;

        int version = Settings::VERSION;
        const cv::FileNode vn = root["version"];
        if (vn.isInt()) version = static_cast<int>(vn);
        if (version < 1 || version > Settings::VERSION) {
            std::cerr << "[Settings] " << path << ": version " << version
                      << " not supported (max " << Settings::VERSION << ")\n";
            return SettingsStatus::VERSION_UNSUPPORTED;
        }

        std::string diff;
        readString(root, "difficulty", diff);
        if (!diff.empty() && !parseDifficulty(diff, s.difficulty)) {
            std::cerr << "[Settings] unknown difficulty '" << diff << "', keeping "
                      << DifficultyStr(s.difficulty) << "\n";
        }

        const cv::FileNode roi = root["roi"];
        if (roi.isMap()) {
            for (std::size_t i = 0; i < DIFFICULTY_COUNT; ++i) {
                readRect(roi[DIFFICULTY_KEYS[i]], s.roi_by_difficulty[i]);
            }
        }

        readDetector(root["detector"], s.detector);
        readString(root, "source", s.source);
        readString(root, "csv_path", s.csv_path);
    } catch (const cv::Exception& e) {
        std::cerr << "[Settings] " << path << ": " << e.what() << "\n";
        return SettingsStatus::PARSE_FAIL;
    }

    for (auto& r : s.roi_by_difficulty) r = sanitiseRoi(r);
    s.detector = det::sanitise(s.detector);
    s.version = Settings::VERSION;

    inout = s;
    return SettingsStatus::OK;
}

SettingsStatus saveSettings(const std::string& path, const Settings& in) {
    try {
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        if (!fs.isOpened()) return SettingsStatus::OPEN_FAIL;

        fs << "version" << Settings::VERSION;
        fs << "difficulty" << DifficultyStr(in.difficulty);

        fs << "roi" << "{";
        for (std::size_t i = 0; i < DIFFICULTY_COUNT; ++i) {
            writeRect(fs, DIFFICULTY_KEYS[i], in.roi_by_difficulty[i]);
        }
        fs << "}";

        writeDetector(fs, in.detector);
        fs << "source" << in.source;
        if (!in.csv_path.empty()) fs << "csv_path" << in.csv_path;
        fs.release();
    } catch (const cv::Exception& e) {
        std::cerr << "[Settings] " << path << ": " << e.what() << "\n";
        return SettingsStatus::WRITE_FAIL;
    }
    return SettingsStatus::OK;
}

} // namespace core
