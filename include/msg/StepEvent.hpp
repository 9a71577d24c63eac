#pragma once
#include <cstdint>

namespace msg {

// Semantic class of a confirmed flash.
enum class EventKind : uint8_t { REVEAL = 0, INPUT = 1 };

// Which detector path confirmed the flash (diagnostic only).
enum class TriggerPath : uint8_t { HOLD = 0, ENERGY = 1 };

// One confirmed event, as recorded in the step history.
struct Step {
    uint16_t row = 0;          // 0-based
    uint16_t col = 0;          // 0-based
    uint16_t cell = 0;         // row * cols + col
    uint32_t frame_id = 0;     // detector tick index
    uint64_t t_ms = 0;         // event time (Rtos::NowMs clock)
    float    confidence = 0.0f;  // 0..1, margin above thr_high
    EventKind   kind = EventKind::REVEAL;
    TriggerPath path = TriggerPath::HOLD;
};

inline const char* EventKindStr(EventKind k) {
    return k == EventKind::INPUT ? "INPUT" : "REVEAL";
}

} // namespace msg
