#pragma once
#include <atomic>
#include <cstdint>
#include <string>

#include "apps/det/DetectorTask.hpp"

#include "msg/StepEvent.hpp"
#include "msg/RoundState.hpp"

namespace monitor {

// -------------------- Monitor task --------------------
// Low-priority observer task:
// - Non-blocking reads from the step and status queues.
// - Prints every confirmed step, the round sequence on phase changes and a
//   status line at a slow cadence, so it never perturbs detector timing.
// - Optionally appends every step to a CSV file.

struct MonitorConfig {
    uint32_t print_period_ms = 1000;
    uint32_t poll_period_ms  = 20;

    // Empty: no CSV.
    std::string csv_path;
};

struct MonitorCtx {
    det::StepQueue*    step_in   = nullptr;
    det::StatusQueue*  status_in = nullptr;
    det::DetectorTask* detector  = nullptr;   // for the sequence text
    std::atomic<bool>* stop      = nullptr;   // set by main at shutdown
    MonitorConfig cfg;
};

// One CSV row per step: k,t_ms,frame,round,kind,row,col,cell,confidence,path
std::string CsvHeader();
std::string CsvRow(uint32_t k, uint32_t round_index, const msg::Step& s);

// One line of status for the console.
std::string StatusLine(const msg::DetectorStatus& st);

// OSAL task entry
void TaskEntry(void* arg);

} // namespace monitor
