#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "os/rtos.hpp"
#include "types.hpp"

#include "apps/io/FrameSource.hpp"          // for LiveFrameQueue / ReleaseFrameQueue typedefs
#include "apps/det/SequenceDetector.hpp"

#include "msg/ImageFrame.hpp"
#include "msg/StepEvent.hpp"
#include "msg/RoundState.hpp"

namespace det {

// Everything SetConfig replaces, applied together at a frame boundary.
struct DetectorSetup {
    Rect           roi{};
    GridConfig     grid{};
    DetectorConfig cfg{};
};

// Commands are applied by the detector thread between frames.
enum class DetCmdType : uint8_t {
    Start,
    Stop,
    Calibrate,
    Reset,
    Arm,
    Undo,
    SetConfig,
    Quit,
};

struct DetCmd {
    DetCmdType type = DetCmdType::Start;
    DetectorSetup setup{};   // SetConfig only
};

const char* DetCmdTypeStr(DetCmdType t);

// ------------------------------
// Queue types
// ------------------------------
using CmdQueue    = Rtos::Queue<DetCmd, 8>;
using StepQueue   = Rtos::Queue<msg::Step, 64>;              // never blocks the detector
using StatusQueue = Rtos::Queue<msg::DetectorStatus, 1>;     // freshest-wins

// ---------------------------------------------------------------------------
//  DetectorTask
// ---------------------------------------------------------------------------
class DetectorTask {
public:
    // NOTE: The TaskCtx object must outlive the task.
    struct TaskCtx {
        DetectorTask* self = nullptr;

        io::LiveFrameQueue*    live_in     = nullptr;   // source -> detector (freshest-wins)
        io::ReleaseFrameQueue* release_out = nullptr;   // detector -> source (must not drop)

        CmdQueue* command_in = nullptr;

        // Optional taps
        StepQueue*   step_out   = nullptr;
        StatusQueue* status_out = nullptr;
    };

    // How long the loop waits for a frame before polling deadlines anyway.
    static constexpr uint32_t IDLE_POLL_MS = 50;

public:
    explicit DetectorTask(const DetectorSetup& setup);

    static void TaskEntry(void* arg);

    void RequestStop() { m_stop_requested.store(true); }
    bool StopRequested() const { return m_stop_requested.load(); }

    // Send a Calibrate command and block until the window has closed.
    // Called from any thread except the detector's own. False on timeout or
    // when the command queue is full.
    bool Calibrate(CmdQueue& command_in, uint32_t timeout_ms);

    // Thread-safe copies of the round history, refreshed after every change.
    std::vector<msg::Step> Steps() const;
    std::string SequenceText() const;

    uint32_t droppedSteps() const { return m_dropped_steps.load(); }

private:
    // Main run loop. Called only by the detector thread.
    void Run(io::LiveFrameQueue& live_in, io::ReleaseFrameQueue& release_out,
             CmdQueue* command_in, StepQueue* step_out, StatusQueue* status_out);

    // Applied at a safe point (frame boundary or idle wake-up).
    void drainCommands(CmdQueue* command_in);
    void applyCommand(const DetCmd& cmd);

    void afterTick(std::size_t n_events, StepQueue* step_out, StatusQueue* status_out);
    void refreshSnapshot();

private:
    SequenceDetector m_det;
    StepArray        m_events{};

    std::atomic<bool>     m_stop_requested{false};
    std::atomic<uint32_t> m_dropped_steps{0};

    Rtos::BinarySemaphore m_calib_done;

    // Snapshot of the FSM history for other threads.
    mutable Rtos::Mutex    m_snap_lock;
    std::vector<msg::Step> m_snap_steps;
    uint32_t m_snap_revision = 0xFFFFFFFFu;
};

} // namespace det
