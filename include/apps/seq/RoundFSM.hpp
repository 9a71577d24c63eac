#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "msg/RoundState.hpp"
#include "msg/StepEvent.hpp"
#include "apps/det/DetectorConfig.hpp"
#include "apps/seq/DeadlineTimer.hpp"

namespace seq {

// ---------------------------------------------------------------------------
// RoundFSM: turns confirmed flash events into rounds of the memory game.
//
//   IDLE -> ARMED -> REVEAL -> WAITING_INPUT -> REARMING -> ARMED -> ...
//
// Driven from one thread only: onEvent() per confirmed event and poll() per
// tick (or idle wake-up). Time comes from the caller, never from a clock.
//
// Reveal termination, evaluated per event while in REVEAL:
//   1. expected length (use_expected_reveal_len): the event is appended and
//      the reveal ends when it reaches initial_reveal_len + round_index;
//   2. hard timeout (use_expected_reveal_len): a gap since the previous
//      reveal event above reveal_hard_timeout_ms ends the reveal;
//   3. an INPUT-kind event ends the reveal, and so does a gap above
//      reveal_max_isi_ms when the expected-length policy is off.
// Rules 2 and 3 are checked before the event is appended; an event that
// ends the reveal that way counts as the first input.
// ---------------------------------------------------------------------------
class RoundFSM {
public:
    explicit RoundFSM(const det::DetectorConfig& cfg = {});

    // Timing/policy fields only; takes effect from the next event or poll.
    void setConfig(const det::DetectorConfig& cfg);

    // Feed one confirmed event. step.t_ms is the current time.
    void onEvent(const msg::Step& step);

    // Fire any pending deadline.
    void poll(uint64_t now_ms);

    // IDLE, round 0, history and trackers cleared.
    void reset();

    // Force ARMED (manual round start). Round index is kept.
    void arm(uint64_t now_ms);

    // Drop the last recorded step. False if history is empty.
    bool undo();

    const msg::RoundState& state() const { return m_state; }
    msg::RoundPhase phase() const { return m_state.phase; }
    uint32_t epoch() const { return m_epoch; }

    // Bumped on every change of state or history.
    uint32_t revision() const { return m_revision; }

    // Kind given to events the colour gate cannot classify.
    msg::EventKind bias() const {
        return m_state.phase == msg::RoundPhase::WAITING_INPUT ? msg::EventKind::INPUT
                                                               : msg::EventKind::REVEAL;
    }

    // Reveal length that ends the current round's reveal under policy 1.
    uint32_t expectedRevealLen() const;

    const std::vector<msg::Step>& steps() const { return m_steps; }

    // "r1c1 r2c3 ..." (one-based) for the recorded steps.
    std::string sequenceText() const;
    static std::string SequenceText(const std::vector<msg::Step>& steps);

private:
    void enter(msg::RoundPhase next, uint64_t now_ms, const char* why);
    void clearRound();
    void clearHistory();

    void startReveal(const msg::Step& step);
    void handleReveal(const msg::Step& step);
    void endReveal(uint64_t now_ms, const char* why);
    void countInput(const msg::Step& step);

    void armRevealDeadline();

private:
    det::DetectorConfig m_cfg{};

    msg::RoundState m_state{};
    uint32_t m_epoch = 0;
    uint32_t m_revision = 0;
    DeadlineTimer m_deadline{};

    std::vector<msg::Step> m_steps;
};

} // namespace seq
