#pragma once
#include <cstdint>
#include <cstddef>
#include <array>

#include "msg/CellFrame.hpp"

namespace msg {

// idle is only the pre-start state; the rest cycle once per round.
enum class RoundPhase : uint8_t {
    IDLE = 0,
    ARMED,
    REVEAL,
    WAITING_INPUT,
    REARMING,
};

inline const char* RoundPhaseStr(RoundPhase p) {
    switch (p) {
        case RoundPhase::IDLE:          return "IDLE";
        case RoundPhase::ARMED:         return "ARMED";
        case RoundPhase::REVEAL:        return "REVEAL";
        case RoundPhase::WAITING_INPUT: return "WAITING_INPUT";
        case RoundPhase::REARMING:      return "REARMING";
        default:                        return "UNKNOWN";
    }
}

// Longest reveal the tracker can hold in one round.
constexpr std::size_t MAX_REVEAL_LEN = 128;

struct RoundState {
    RoundPhase phase = RoundPhase::IDLE;
    uint32_t round_index = 0;

    uint16_t reveal_len = 0;       // number of cells observed in this round's reveal
    uint16_t input_progress = 0;   // inputs counted against reveal_len

    uint64_t last_event_ms = 0;
    uint64_t last_reveal_event_ms = 0;
    uint64_t phase_since_ms = 0;   // time the current phase was entered

    std::array<uint16_t, MAX_REVEAL_LEN> reveal_indices{};  // cell indices, first reveal_len valid
    uint16_t input_count = 0;
};

// Snapshot published for whoever presents the detector (console, overlay...).
struct DetectorStatus {
    uint8_t running = 0;
    uint8_t calibrating = 0;

    RoundState round{};
    uint32_t step_count = 0;

    int16_t hot_index = -1;        // cell with the largest smoothed delta, -1 if none
    float   hot_confidence = 0.0f; // 0..1

    float    fps = 0.0f;           // EMA of tick rate
    uint32_t frame_index = 0;      // ticks processed since start/reset

    uint16_t rows = 0;
    uint16_t cols = 0;
};

} // namespace msg
