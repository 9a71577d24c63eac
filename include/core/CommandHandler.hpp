#pragma once
#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "apps/det/DetectorTask.hpp"

namespace core {

enum class CommandId : uint8_t {
    START = 0,
    STOP,
    CALIBRATE,
    RESET,
    ARM,
    UNDO,
    SEQ,
    HELP,
    QUIT,
    UNKNOWN,
};

// Case-insensitive, surrounding blanks ignored. Empty lines are UNKNOWN.
CommandId parseCommand(const std::string& line);
const char* CommandIdStr(CommandId id);

// ---------------------------------------------------------------------------
// CommandHandler: operator text commands in, detector commands out.
// One command per line; runs on its own task so a blocking Calibrate()
// never stalls the detector.
// ---------------------------------------------------------------------------
class CommandHandler {
public:
    struct TaskCtx {
        CommandHandler*     self     = nullptr;
        det::CmdQueue*      cmd_out  = nullptr;
        det::DetectorTask*  detector = nullptr;   // for Calibrate() and the sequence text
        std::istream*       in       = nullptr;   // std::cin when null
    };

    static constexpr uint32_t CALIBRATE_TIMEOUT_MS = 5000;
    static constexpr uint32_t SEND_TIMEOUT_MS = 500;

    CommandHandler() = default;

    static void TaskEntry(void* arg);

    // Handle one line. Returns false once the session should end (quit).
    bool handleLine(const std::string& line, det::CmdQueue& cmd_out, det::DetectorTask* detector);

    bool QuitRequested() const { return m_quit.load(); }

private:
    bool forward(det::CmdQueue& cmd_out, det::DetCmdType type);
    static void printHelp();

    std::atomic<bool> m_quit{false};
};

} // namespace core
