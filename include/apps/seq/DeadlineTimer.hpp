#pragma once
#include <cstdint>

#include "msg/RoundState.hpp"

namespace seq {

// ---------------------------------------------------------------------------
// DeadlineTimer: a polled one-shot deadline scoped to one FSM phase.
// The owner bumps its epoch on every transition; a deadline armed under an
// older (phase, epoch) pair never fires, even if nobody cancelled it.
// ---------------------------------------------------------------------------
class DeadlineTimer {
public:
    void arm(uint64_t deadline_ms, msg::RoundPhase phase, uint32_t epoch) {
        m_deadline_ms = deadline_ms;
        m_phase = phase;
        m_epoch = epoch;
        m_armed = true;
    }

    void cancel() { m_armed = false; }

    bool armed() const { return m_armed; }
    uint64_t deadline() const { return m_deadline_ms; }

    // True once the deadline has passed while (phase, epoch) is still the one
    // it was armed for. Fires at most once; a stale timer is dropped silently.
    bool expired(uint64_t now_ms, msg::RoundPhase phase, uint32_t epoch) {
        if (!m_armed) return false;
        if (phase != m_phase || epoch != m_epoch) {
            m_armed = false;
            return false;
        }
        if (now_ms <= m_deadline_ms) return false;
        m_armed = false;
        return true;
    }

private:
    uint64_t m_deadline_ms = 0;
    msg::RoundPhase m_phase = msg::RoundPhase::IDLE;
    uint32_t m_epoch = 0;
    bool m_armed = false;
};

} // namespace seq
