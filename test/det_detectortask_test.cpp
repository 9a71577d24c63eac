// test/det_detectortask_test.cpp
// Detector thread driven through its queues, no camera.

#include <iostream>

#include <opencv2/core.hpp>

#include "os/rtos.hpp"
#include "apps/det/DetectorTask.hpp"
#include "apps/io/FrameSource.hpp"

namespace {

int g_failures = 0;

void check(bool ok, const char* what) {
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
    if (!ok) ++g_failures;
}

// Waits for a status matching 'pred', up to ~2 s.
template <typename Pred>
bool waitStatus(det::StatusQueue& q, Pred pred, msg::DetectorStatus& last) {
    for (int i = 0; i < 40; ++i) {
        if (q.receive(last, 50) && pred(last)) return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "=== DETECTOR TASK TEST ===\n";

    io::LiveFrameQueue    liveQ(/*overwrite=*/true);
    io::ReleaseFrameQueue releaseQ(/*overwrite=*/false);
    det::CmdQueue    cmdQ(/*overwrite=*/false);
    det::StepQueue   stepQ(/*overwrite=*/false);
    det::StatusQueue statusQ(/*overwrite=*/true);

    det::DetectorSetup setup{};
    setup.roi = Rect{0.0f, 0.0f, 1.0f, 1.0f};
    setup.grid = GridConfig{2, 2};
    setup.cfg.calibration_window_ms = 100;

    det::DetectorTask detector(setup);

    det::DetectorTask::TaskCtx ctx{};
    ctx.self        = &detector;
    ctx.live_in     = &liveQ;
    ctx.release_out = &releaseQ;
    ctx.command_in  = &cmdQ;
    ctx.step_out    = &stepQ;
    ctx.status_out  = &statusQ;

    Rtos::Task task;
    check(task.Create("Detector", &det::DetectorTask::TaskEntry, &ctx), "detector task created");

    // ---- Calibration completes on idle wake-ups alone ----
    const uint64_t t0 = Rtos::NowMs();
    check(detector.Calibrate(cmdQ, 3000), "calibrate returns without frames");
    check(Rtos::NowMs() - t0 >= 100, "calibrate waited for the window");

    // ---- Start, then a frame goes in and comes back ----
    det::DetCmd start{};
    start.type = det::DetCmdType::Start;
    check(cmdQ.send(start, 1000), "start queued");

    msg::DetectorStatus st{};
    check(waitStatus(statusQ, [](const msg::DetectorStatus& s) { return s.running != 0; }, st),
          "status reports running");

    cv::Mat img(40, 40, CV_8UC3, cv::Scalar(60, 60, 60));
    msg::ImageFrame frame{};
    frame.data = img.data;
    frame.width = 40;
    frame.height = 40;
    frame.stride = static_cast<uint32_t>(img.step[0]);
    frame.format = msg::PixelFormat::BGR8;
    frame.t_capture_us = Rtos::NowUs();
    frame.frame_id = 1;
    frame.buf_index = 3;
    check(liveQ.send(frame, 1000), "frame published");

    msg::ImageFrame back{};
    check(releaseQ.receive(back, 2000) && back.buf_index == 3 && back.frame_id == 1,
          "frame released back to the source");

    check(waitStatus(statusQ, [](const msg::DetectorStatus& s) { return s.frame_index >= 1; }, st),
          "frame ticked");

    // ---- Reconfigure between frames ----
    det::DetCmd set{};
    set.type = det::DetCmdType::SetConfig;
    set.setup = setup;
    set.setup.grid = GridConfig{3, 3};
    check(cmdQ.send(set, 1000), "set config queued");
    check(waitStatus(statusQ, [](const msg::DetectorStatus& s) { return s.rows == 3 && s.cols == 3; }, st),
          "new grid applied");

    det::DetCmd undo{};
    undo.type = det::DetCmdType::Undo;
    check(cmdQ.send(undo, 1000), "undo on empty history is harmless");

    // ---- Quit ----
    det::DetCmd quit{};
    quit.type = det::DetCmdType::Quit;
    check(cmdQ.send(quit, 1000), "quit queued");
    task.Join();

    check(detector.Steps().empty() && detector.SequenceText().empty(), "no steps without flashes");
    check(detector.droppedSteps() == 0, "nothing dropped");

    msg::Step s{};
    check(!stepQ.try_receive(s), "no step published");

    std::cout << (g_failures ? "DETECTOR TASK TEST FAILED\n" : "DETECTOR TASK TEST PASSED\n");
    return g_failures ? -1 : 0;
}
