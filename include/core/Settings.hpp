#pragma once
#include <array>
#include <cstdint>
#include <string>

#include "types.hpp"
#include "apps/det/DetectorConfig.hpp"

namespace core {

constexpr std::size_t DIFFICULTY_COUNT = 4;

// ---------------------------------------------------------------------------
// Settings: everything the application persists between runs.
// Loaded once at start-up; fields missing from the file keep their default.
// ---------------------------------------------------------------------------
struct Settings {
    static constexpr int VERSION = 1;

    int version = VERSION;

    Difficulty difficulty = Difficulty::HARD;

    // The game board sits in a different place per difficulty, so the ROI is
    // remembered per difficulty.
    std::array<Rect, DIFFICULTY_COUNT> roi_by_difficulty{};

    det::DetectorConfig detector{};

    // Frame source uri (camera index, file, pattern or URL).
    std::string source = "0";

    // Append confirmed steps here when not empty.
    std::string csv_path;

    Rect& activeRoi() { return roi_by_difficulty[static_cast<std::size_t>(difficulty)]; }
    const Rect& activeRoi() const { return roi_by_difficulty[static_cast<std::size_t>(difficulty)]; }
    GridConfig grid() const;
};

// ---- Difficulty presets ----
GridConfig gridForDifficulty(Difficulty d);
det::DetectorConfig detectorForDifficulty(Difficulty d);
const char* DifficultyStr(Difficulty d);
bool parseDifficulty(const std::string& s, Difficulty& out);   // case-insensitive

// ---- Field helpers ----
// Clamp to the frame, keep every side >= ROI_MIN_SIDE.
constexpr float ROI_MIN_SIDE = 0.05f;
Rect sanitiseRoi(const Rect& in);

// "x,y,w,h" in normalised units.
bool parseRoi(const std::string& s, Rect& out);

// "#rrggbb" or "#rgb" (leading '#' optional).
bool parseHexColor(const std::string& s, Rgb8& out);
std::string toHexColor(const Rgb8& c);

// ---- Persistence (YAML/JSON/XML, picked from the file extension) ----
enum class SettingsStatus : uint8_t {
    OK = 0,
    OPEN_FAIL,
    PARSE_FAIL,
    VERSION_UNSUPPORTED,
    WRITE_FAIL,
};

const char* SettingsStatusStr(SettingsStatus s);

// Merge the file into 'inout' (start from defaults). Every value read is
// sanitised; on failure 'inout' is left untouched.
SettingsStatus loadSettings(const std::string& path, Settings& inout);

// Write every field.
SettingsStatus saveSettings(const std::string& path, const Settings& in);

} // namespace core
