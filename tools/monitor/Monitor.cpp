#include "Monitor.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "os/rtos.hpp"

namespace monitor {

// ---------------- formatting ----------------

std::string CsvHeader() {
    return "k,t_ms,frame,round,kind,row,col,cell,confidence,path\n";
}

std::string CsvRow(uint32_t k, uint32_t round_index, const msg::Step& s) {
    char buf[192];
    std::snprintf(buf, sizeof(buf), "%u,%llu,%u,%u,%s,%u,%u,%u,%.3f,%s\n",
                  k, static_cast<unsigned long long>(s.t_ms), s.frame_id, round_index,
                  msg::EventKindStr(s.kind),
                  static_cast<unsigned>(s.row + 1), static_cast<unsigned>(s.col + 1),
                  static_cast<unsigned>(s.cell), s.confidence,
                  s.path == msg::TriggerPath::ENERGY ? "energy" : "hold");
    return buf;
}

std::string StatusLine(const msg::DetectorStatus& st) {
    char hot[32] = "-";
    if (st.hot_index >= 0 && st.cols > 0) {
        std::snprintf(hot, sizeof(hot), "r%dc%d %.2f",
                      st.hot_index / st.cols + 1, st.hot_index % st.cols + 1,
                      st.hot_confidence);
    }

    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "%s%s phase=%s round=%u reveal=%u input=%u/%u steps=%u hot=%s fps=%.1f frame=%u",
                  st.running ? "RUN" : "STOP",
                  st.calibrating ? "+CAL" : "",
                  msg::RoundPhaseStr(st.round.phase),
                  st.round.round_index,
                  static_cast<unsigned>(st.round.reveal_len),
                  static_cast<unsigned>(st.round.input_progress),
                  static_cast<unsigned>(st.round.reveal_len),
                  st.step_count, hot, st.fps, st.frame_index);
    return buf;
}

// ---------------- CSV logging ----------------

static std::ofstream open_csv(const std::string& path) {
    const std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

    const bool fresh = !std::filesystem::exists(p, ec);
    std::ofstream f(path, std::ios::out | std::ios::app);
    if (!f) {
        std::cout << "[MONITOR] ERROR: could not open CSV: " << path
                  << " errno=" << errno << " (" << std::strerror(errno) << ")\n";
        return f;
    }
    std::cout << "[MONITOR] CSV open: " << path << "\n";
    if (fresh) f << CsvHeader();
    return f;
}

// ---------------- task entry ----------------

void TaskEntry(void* arg) {
    auto* ctx = static_cast<MonitorCtx*>(arg);
    if (!ctx || (!ctx->step_in && !ctx->status_in)) return;

    std::cout << "[MONITOR] started\n";

    std::ofstream csv;
    if (!ctx->cfg.csv_path.empty()) {
        csv = open_csv(ctx->cfg.csv_path);
    }

    const uint64_t print_period_ms = ctx->cfg.print_period_ms;
    uint64_t last_print_ms = Rtos::NowMs();

    msg::DetectorStatus last{};
    bool have_status = false;
    msg::RoundPhase last_phase = msg::RoundPhase::IDLE;
    uint32_t k = 0;

    while (!(ctx->stop && ctx->stop->load())) {

        if (ctx->status_in) {
            msg::DetectorStatus st{};
            while (ctx->status_in->try_receive(st)) {
                last = st;
                have_status = true;
            }
        }

        if (ctx->step_in) {
            msg::Step s{};
            while (ctx->step_in->try_receive(s)) {
                std::cout << "[MONITOR] step " << k << ": " << msg::EventKindStr(s.kind)
                          << " r" << (s.row + 1) << "c" << (s.col + 1) << "\n";
                if (csv) {
                    csv << CsvRow(k, last.round.round_index, s);
                    csv.flush();
                }
                k++;
            }
        }

        if (have_status && last.round.phase != last_phase) {
            std::cout << "[MONITOR] phase " << msg::RoundPhaseStr(last_phase)
                      << " -> " << msg::RoundPhaseStr(last.round.phase) << "\n";
            if (ctx->detector) {
                const std::string text = ctx->detector->SequenceText();
                if (!text.empty()) std::cout << "[MONITOR] sequence: " << text << "\n";
            }
            last_phase = last.round.phase;
        }

        const uint64_t now = Rtos::NowMs();
        if (have_status && now - last_print_ms >= print_period_ms) {
            std::cout << "[MONITOR] " << StatusLine(last) << "\n";
            last_print_ms = now;
        }

        Rtos::SleepMs(static_cast<int>(ctx->cfg.poll_period_ms));
    }

    if (ctx->detector && ctx->detector->droppedSteps() > 0) {
        std::cout << "[MONITOR] " << ctx->detector->droppedSteps()
                  << " steps dropped on a full queue\n";
    }
    std::cout << "[MONITOR] stopped after " << k << " steps\n";
}

} // namespace monitor
