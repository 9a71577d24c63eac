#include <atomic>
#include <cstring>
#include <iostream>
#include <string>

#include "os/rtos.hpp"

#include "core/Settings.hpp"
#include "core/CommandHandler.hpp"
#include "apps/io/FrameSource.hpp"
#include "apps/det/DetectorTask.hpp"
#include "monitor/Monitor.hpp"

namespace {

struct Args {
    std::string source;
    std::string settings_path;
    std::string difficulty;
    std::string roi;
    std::string csv;
    bool save = false;
    bool calibrate = true;
    bool loop = false;
};

void print_usage(const char* argv0) {
    std::cout
        << "Usage: " << argv0 << " [options]\n"
        << "  --source <uri>         camera index, video file or stream (default: settings / 0)\n"
        << "  --settings <file>      settings file (.yml/.yaml/.json/.xml)\n"
        << "  --difficulty <d>       easy | medium | hard | expert\n"
        << "  --roi x,y,w,h          board region, normalised to the frame\n"
        << "  --csv <file>           append confirmed steps to a CSV file\n"
        << "  --save                 write the effective settings back to --settings\n"
        << "  --no-calibrate         skip the start-up calibration\n"
        << "  --loop                 restart file sources at the end\n"
        << "  --help\n";
}

// Returns false on a bad or missing argument (or --help).
bool parse_args(int argc, char** argv, Args& a) {
    for (int i = 1; i < argc; ++i) {
        const char* k = argv[i];
        auto need = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "[MAIN] missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (!std::strcmp(k, "--help") || !std::strcmp(k, "-h")) {
            return false;
        } else if (!std::strcmp(k, "--source")) {
            const char* v = need(k); if (!v) return false; a.source = v;
        } else if (!std::strcmp(k, "--settings")) {
            const char* v = need(k); if (!v) return false; a.settings_path = v;
        } else if (!std::strcmp(k, "--difficulty")) {
            const char* v = need(k); if (!v) return false; a.difficulty = v;
        } else if (!std::strcmp(k, "--roi")) {
            const char* v = need(k); if (!v) return false; a.roi = v;
        } else if (!std::strcmp(k, "--csv")) {
            const char* v = need(k); if (!v) return false; a.csv = v;
        } else if (!std::strcmp(k, "--save")) {
            a.save = true;
        } else if (!std::strcmp(k, "--no-calibrate")) {
            a.calibrate = false;
        } else if (!std::strcmp(k, "--loop")) {
            a.loop = true;
        } else {
            std::cerr << "[MAIN] unknown argument " << k << "\n";
            return false;
        }
    }
    return true;
}

// Settings file first, command line on top.
bool resolve_settings(const Args& args, core::Settings& s) {
    if (!args.settings_path.empty()) {
        const core::SettingsStatus st = core::loadSettings(args.settings_path, s);
        if (st == core::SettingsStatus::OPEN_FAIL) {
            std::cout << "[MAIN] no settings at " << args.settings_path << ", using defaults\n";
        } else if (st != core::SettingsStatus::OK) {
            std::cerr << "[MAIN] settings " << args.settings_path << ": "
                      << core::SettingsStatusStr(st) << "\n";
            return false;
        }
    }

    if (!args.difficulty.empty() && !core::parseDifficulty(args.difficulty, s.difficulty)) {
        std::cerr << "[MAIN] unknown difficulty '" << args.difficulty << "'\n";
        return false;
    }
    if (!args.roi.empty()) {
        Rect r{};
        if (!core::parseRoi(args.roi, r)) {
            std::cerr << "[MAIN] bad --roi '" << args.roi << "', expected x,y,w,h\n";
            return false;
        }
        s.activeRoi() = core::sanitiseRoi(r);
    }
    if (!args.source.empty()) s.source = args.source;
    if (!args.csv.empty()) s.csv_path = args.csv;

    if (args.save && !args.settings_path.empty()) {
        const core::SettingsStatus st = core::saveSettings(args.settings_path, s);
        if (st != core::SettingsStatus::OK) {
            std::cerr << "[MAIN] could not save settings: " << core::SettingsStatusStr(st) << "\n";
        } else {
            std::cout << "[MAIN] settings saved to " << args.settings_path << "\n";
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return -1;
    }

    core::Settings settings{};
    if (!resolve_settings(args, settings)) return -1;

    const Rect roi = settings.activeRoi();
    const GridConfig grid = settings.grid();
    std::cout << "[MAIN] difficulty=" << core::DifficultyStr(settings.difficulty)
              << " grid=" << grid.rows << "x" << grid.cols
              << " roi=(" << roi.x << "," << roi.y << "," << roi.width << "," << roi.height << ")"
              << " source=" << settings.source << "\n";

    // ---- QUEUES ----
    io::LiveFrameQueue    liveFrameQueue(/*overwrite=*/true);
    io::ReleaseFrameQueue releaseFrameQueue(/*overwrite=*/false);

    det::CmdQueue    cmdQueue(/*overwrite=*/false);
    det::StepQueue   stepQueue(/*overwrite=*/false);
    det::StatusQueue statusQueue(/*overwrite=*/true);

    // ---- MODULES ----
    io::FrameSourceConfig src_cfg{};
    src_cfg.uri  = settings.source;
    src_cfg.loop = args.loop;

    det::DetectorSetup setup{};
    setup.roi  = roi;
    setup.grid = grid;
    setup.cfg  = settings.detector;

    io::FrameSource       source(src_cfg);
    det::DetectorTask     detector(setup);
    core::CommandHandler  commands;

    // ---- TASK CONTEXTS ----
    // Owned by main; lifetime OK because main outlives every task it joins.
    io::FrameSource::TaskCtx src_ctx{};
    src_ctx.self       = &source;
    src_ctx.live_out   = &liveFrameQueue;
    src_ctx.release_in = &releaseFrameQueue;

    det::DetectorTask::TaskCtx det_ctx{};
    det_ctx.self        = &detector;
    det_ctx.live_in     = &liveFrameQueue;
    det_ctx.release_out = &releaseFrameQueue;
    det_ctx.command_in  = &cmdQueue;
    det_ctx.step_out    = &stepQueue;
    det_ctx.status_out  = &statusQueue;

    core::CommandHandler::TaskCtx cmd_ctx{};
    cmd_ctx.self     = &commands;
    cmd_ctx.cmd_out  = &cmdQueue;
    cmd_ctx.detector = &detector;

    std::atomic<bool> monitor_stop{false};
    monitor::MonitorCtx mon_ctx{};
    mon_ctx.step_in   = &stepQueue;
    mon_ctx.status_in = &statusQueue;
    mon_ctx.detector  = &detector;
    mon_ctx.stop      = &monitor_stop;
    mon_ctx.cfg.csv_path = settings.csv_path;

    // ---- TASKS ----
    Rtos::Task FrameSourceTask;
    Rtos::Task DetectTask;
    Rtos::Task CommandTask;
    Rtos::Task MonitorTask;

    if (!FrameSourceTask.Create("FrameSource", &io::FrameSource::TaskEntry, &src_ctx) ||
        !DetectTask.Create("Detector", &det::DetectorTask::TaskEntry, &det_ctx) ||
        !MonitorTask.Create("Monitor", &monitor::TaskEntry, &mon_ctx) ||
        !CommandTask.Create("Command", &core::CommandHandler::TaskEntry, &cmd_ctx)) {
        std::cerr << "[MAIN] task creation failed\n";
        // Tasks that did start still hold pointers into this frame.
        det::DetCmd quit{};
        quit.type = det::DetCmdType::Quit;
        (void)cmdQueue.send(quit, 100);
        DetectTask.Join();
        source.RequestStop();
        FrameSourceTask.Join();
        monitor_stop.store(true);
        MonitorTask.Join();
        return -1;
    }

    det::DetCmd start{};
    start.type = det::DetCmdType::Start;
    (void)cmdQueue.send(start, Rtos::MAX_TIMEOUT);
    if (args.calibrate) {
        det::DetCmd cal{};
        cal.type = det::DetCmdType::Calibrate;
        (void)cmdQueue.send(cal, Rtos::MAX_TIMEOUT);
    }

    // Run until the operator quits or a file source runs dry.
    while (!commands.QuitRequested() && !source.Finished()) {
        Rtos::SleepMs(100);
    }

    if (!commands.QuitRequested()) {
        det::DetCmd quit{};
        quit.type = det::DetCmdType::Quit;
        (void)cmdQueue.send(quit, Rtos::MAX_TIMEOUT);
    }

    DetectTask.Join();
    source.RequestStop();
    FrameSourceTask.Join();

    monitor_stop.store(true);
    MonitorTask.Join();

    // The command task may still sit in getline(); it is detached on exit.
    if (commands.QuitRequested()) CommandTask.Join();

    const std::string text = detector.SequenceText();
    std::cout << "[MAIN] final sequence: " << (text.empty() ? "(empty)" : text) << "\n";
    return 0;
}
