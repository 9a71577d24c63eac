#include "apps/seq/RoundFSM.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace seq {

using msg::RoundPhase;

RoundFSM::RoundFSM(const det::DetectorConfig& cfg) {
    setConfig(cfg);
    m_steps.reserve(256);
}

void RoundFSM::setConfig(const det::DetectorConfig& cfg) {
    m_cfg = det::sanitise(cfg);
}

uint32_t RoundFSM::expectedRevealLen() const {
    return static_cast<uint32_t>(m_cfg.initial_reveal_len) + m_state.round_index;
}

// -------------------- transitions --------------------

void RoundFSM::enter(RoundPhase next, uint64_t now_ms, const char* why) {
    const RoundPhase prev = m_state.phase;
    m_state.phase = next;
    m_state.phase_since_ms = now_ms;
    m_epoch++;
    m_revision++;
    m_deadline.cancel();

    std::cout << "[RoundFSM] " << msg::RoundPhaseStr(prev) << " -> "
              << msg::RoundPhaseStr(next) << " (" << why << ")"
              << " round=" << m_state.round_index
              << " reveal=" << m_state.reveal_len
              << " input=" << m_state.input_progress << "\n";
}

void RoundFSM::clearRound() {
    m_state.reveal_len = 0;
    m_state.input_progress = 0;
    m_state.input_count = 0;
    m_state.last_reveal_event_ms = 0;
    m_state.reveal_indices.fill(0);
}

void RoundFSM::clearHistory() {
    if (!m_cfg.append_across_rounds) m_steps.clear();
}

void RoundFSM::armRevealDeadline() {
    const uint32_t silence = m_cfg.use_expected_reveal_len ? m_cfg.reveal_hard_timeout_ms
                                                           : m_cfg.cluster_gap_ms;
    m_deadline.arm(m_state.last_reveal_event_ms + silence, RoundPhase::REVEAL, m_epoch);
}

void RoundFSM::startReveal(const msg::Step& step) {
    m_state.reveal_indices[0] = step.cell;
    m_state.reveal_len = 1;
    m_state.last_reveal_event_ms = step.t_ms;
    enter(RoundPhase::REVEAL, step.t_ms, "first flash");

    if (m_cfg.use_expected_reveal_len && m_state.reveal_len >= expectedRevealLen()) {
        endReveal(step.t_ms, "expected length");
        return;
    }
    armRevealDeadline();
}

void RoundFSM::handleReveal(const msg::Step& step) {
    const uint64_t gap = step.t_ms - std::min(step.t_ms, m_state.last_reveal_event_ms);

    const char* ended_by = nullptr;
    if (m_cfg.use_expected_reveal_len && gap > m_cfg.reveal_hard_timeout_ms) {
        ended_by = "hard timeout";
    } else if (step.kind == msg::EventKind::INPUT) {
        ended_by = "input colour";
    } else if (!m_cfg.use_expected_reveal_len && gap > m_cfg.reveal_max_isi_ms) {
        ended_by = "gap";
    }

    if (ended_by) {
        endReveal(step.t_ms, ended_by);
        countInput(step);
        return;
    }

    m_state.reveal_indices[m_state.reveal_len++] = step.cell;
    m_state.last_reveal_event_ms = step.t_ms;

    if (m_cfg.use_expected_reveal_len && m_state.reveal_len >= expectedRevealLen()) {
        endReveal(step.t_ms, "expected length");
        return;
    }
    if (m_state.reveal_len >= msg::MAX_REVEAL_LEN) {
        endReveal(step.t_ms, "reveal buffer full");
        return;
    }
    armRevealDeadline();
}

void RoundFSM::endReveal(uint64_t now_ms, const char* why) {
    enter(RoundPhase::WAITING_INPUT, now_ms, why);

    const uint32_t timeout = std::max(det::DetectorConfig::MIN_INPUT_TIMEOUT_MS,
                                      m_cfg.input_timeout_ms);
    m_deadline.arm(now_ms + timeout, RoundPhase::WAITING_INPUT, m_epoch);
}

void RoundFSM::countInput(const msg::Step& step) {
    m_state.input_count++;
    m_state.input_progress++;

    if (m_state.input_progress >= m_state.reveal_len) {
        enter(RoundPhase::REARMING, step.t_ms, "inputs complete");
        m_deadline.arm(step.t_ms + m_cfg.rearm_delay_ms, RoundPhase::REARMING, m_epoch);
    }
}

// -------------------- public --------------------

void RoundFSM::onEvent(const msg::Step& step) {
    poll(step.t_ms);

    m_steps.push_back(step);
    m_state.last_event_ms = step.t_ms;
    m_revision++;

    switch (m_state.phase) {
        case RoundPhase::IDLE:
            if (!m_cfg.auto_round_detect) return;
            enter(RoundPhase::ARMED, step.t_ms, "auto detect");
            clearRound();
            startReveal(step);
            return;

        case RoundPhase::ARMED:
            startReveal(step);
            return;

        case RoundPhase::REVEAL:
            handleReveal(step);
            return;

        case RoundPhase::WAITING_INPUT:
            countInput(step);
            return;

        case RoundPhase::REARMING:
        default:
            return;   // settling, ignore
    }
}

void RoundFSM::poll(uint64_t now_ms) {
    if (!m_deadline.expired(now_ms, m_state.phase, m_epoch)) return;

    switch (m_state.phase) {
        case RoundPhase::REVEAL:
            endReveal(now_ms, m_cfg.use_expected_reveal_len ? "reveal timeout" : "cluster gap");
            break;

        case RoundPhase::WAITING_INPUT:
            std::cerr << "[RoundFSM] input timeout after "
                      << m_state.input_progress << "/" << m_state.reveal_len
                      << " inputs, re-arming round " << m_state.round_index << "\n";
            enter(RoundPhase::ARMED, now_ms, "input timeout");
            clearRound();
            break;

        case RoundPhase::REARMING:
            m_state.round_index++;
            clearRound();
            clearHistory();
            enter(RoundPhase::ARMED, now_ms, "next round");
            break;

        default:
            break;
    }
}

void RoundFSM::reset() {
    m_deadline.cancel();
    m_epoch++;
    m_revision++;
    m_state = msg::RoundState{};
    m_steps.clear();
}

void RoundFSM::arm(uint64_t now_ms) {
    clearRound();
    clearHistory();
    enter(RoundPhase::ARMED, now_ms, "manual");
}

bool RoundFSM::undo() {
    if (m_steps.empty()) return false;
    m_steps.pop_back();
    m_revision++;
    return true;
}

std::string RoundFSM::SequenceText(const std::vector<msg::Step>& steps) {
    std::ostringstream os;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (i) os << ' ';
        os << 'r' << (steps[i].row + 1) << 'c' << (steps[i].col + 1);
    }
    return os.str();
}

std::string RoundFSM::sequenceText() const {
    return SequenceText(m_steps);
}

} // namespace seq
