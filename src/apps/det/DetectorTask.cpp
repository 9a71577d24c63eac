// DetectorTask.cpp
#include "apps/det/DetectorTask.hpp"

#include <iostream>

namespace det {

const char* DetCmdTypeStr(DetCmdType t) {
    switch (t) {
        case DetCmdType::Start:     return "Start";
        case DetCmdType::Stop:      return "Stop";
        case DetCmdType::Calibrate: return "Calibrate";
        case DetCmdType::Reset:     return "Reset";
        case DetCmdType::Arm:       return "Arm";
        case DetCmdType::Undo:      return "Undo";
        case DetCmdType::SetConfig: return "SetConfig";
        case DetCmdType::Quit:      return "Quit";
        default:                    return "UNKNOWN";
    }
}

DetectorTask::DetectorTask(const DetectorSetup& setup)
: m_det(setup.cfg, setup.roi, setup.grid) {
    m_snap_steps.reserve(256);
}

void DetectorTask::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);

    if (!ctx || !ctx->self || !ctx->live_in || !ctx->release_out) {
        std::cerr << "[DetectorTask] TaskEntry: incomplete context\n";
        return;
    }

    ctx->self->Run(*ctx->live_in, *ctx->release_out,
                   ctx->command_in, ctx->step_out, ctx->status_out);
}

void DetectorTask::Run(io::LiveFrameQueue& live_in, io::ReleaseFrameQueue& release_out,
                       CmdQueue* command_in, StepQueue* step_out, StatusQueue* status_out) {
    while (!StopRequested()) {

        drainCommands(command_in);
        if (StopRequested()) break;

        msg::ImageFrame frame{};
        if (!live_in.receive(frame, IDLE_POLL_MS)) {
            // Frame drought: deadlines and calibration still have to move.
            m_det.poll(Rtos::NowMs());
            afterTick(0, step_out, status_out);
            continue;
        }

        const uint64_t now_ms = frame.t_capture_us ? frame.t_capture_us / 1000ull
                                                   : Rtos::NowMs();
        const std::size_t n = m_det.tick(frame, now_ms, m_events);

        // ---- Release buffer back to the source ----
        // Critical: always, and only after the sampler is done with the pixels.
        (void)release_out.send(frame, Rtos::MAX_TIMEOUT);

        afterTick(n, step_out, status_out);
    }

    std::cout << "[DetectorTask] exiting after " << m_det.status().frame_index
              << " frames\n";
}

bool DetectorTask::Calibrate(CmdQueue& command_in, uint32_t timeout_ms) {
    (void)m_calib_done.try_take();   // drop a stale completion

    DetCmd cmd{};
    cmd.type = DetCmdType::Calibrate;
    if (!command_in.send(cmd, timeout_ms)) {
        std::cerr << "[DetectorTask] Calibrate: command queue full\n";
        return false;
    }
    if (!m_calib_done.take(timeout_ms)) {
        std::cerr << "[DetectorTask] Calibrate: no completion within "
                  << timeout_ms << " ms\n";
        return false;
    }
    return true;
}

std::vector<msg::Step> DetectorTask::Steps() const {
    m_snap_lock.lock();
    std::vector<msg::Step> out = m_snap_steps;
    m_snap_lock.unlock();
    return out;
}

std::string DetectorTask::SequenceText() const {
    return seq::RoundFSM::SequenceText(Steps());
}

// -------------------- private helpers --------------------

void DetectorTask::drainCommands(CmdQueue* command_in) {
    if (!command_in) return;
    DetCmd cmd{};
    while (command_in->try_receive(cmd)) {
        applyCommand(cmd);
    }
}

void DetectorTask::applyCommand(const DetCmd& cmd) {
    const uint64_t now_ms = Rtos::NowMs();

    std::cout << "[DetectorTask] cmd " << DetCmdTypeStr(cmd.type) << "\n";

    switch (cmd.type) {
        case DetCmdType::Start:
            m_det.start();
            break;
        case DetCmdType::Stop:
            m_det.stop();
            break;
        case DetCmdType::Calibrate:
            m_det.beginCalibration(now_ms);
            break;
        case DetCmdType::Reset:
            m_det.reset();
            break;
        case DetCmdType::Arm:
            m_det.arm(now_ms);
            break;
        case DetCmdType::Undo:
            if (!m_det.undo()) std::cout << "[DetectorTask] undo: history empty\n";
            break;
        case DetCmdType::SetConfig:
            m_det.configure(cmd.setup.roi, cmd.setup.grid, cmd.setup.cfg);
            break;
        case DetCmdType::Quit:
            RequestStop();
            break;
        default:
            break;
    }
    refreshSnapshot();
}

void DetectorTask::afterTick(std::size_t n_events, StepQueue* step_out, StatusQueue* status_out) {
    for (std::size_t i = 0; i < n_events; ++i) {
        const msg::Step& s = m_events[i];
        std::cout << "[DetectorTask] " << msg::EventKindStr(s.kind)
                  << " r" << (s.row + 1) << "c" << (s.col + 1)
                  << " conf=" << s.confidence
                  << (s.path == msg::TriggerPath::ENERGY ? " (energy)" : "")
                  << "\n";
        if (step_out && !step_out->try_send(s)) {
            m_dropped_steps.fetch_add(1);
        }
    }

    if (m_det.takeCalibrationDone()) {
        m_calib_done.give();
    }

    refreshSnapshot();

    if (status_out) (void)status_out->try_send(m_det.status());
}

void DetectorTask::refreshSnapshot() {
    const seq::RoundFSM& fsm = m_det.fsm();
    if (fsm.revision() == m_snap_revision) return;

    m_snap_lock.lock();
    m_snap_steps = fsm.steps();
    m_snap_lock.unlock();

    m_snap_revision = fsm.revision();
}

} // namespace det
