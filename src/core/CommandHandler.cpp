#include "core/CommandHandler.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace core {

namespace {

std::string trimLower(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;

    std::string out = s.substr(b, e - b);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

CommandId parseCommand(const std::string& line) {
    const std::string w = trimLower(line);
    if (w == "start")                   return CommandId::START;
    if (w == "stop")                    return CommandId::STOP;
    if (w == "calibrate" || w == "cal") return CommandId::CALIBRATE;
    if (w == "reset")                   return CommandId::RESET;
    if (w == "arm")                     return CommandId::ARM;
    if (w == "undo")                    return CommandId::UNDO;
    if (w == "seq")                     return CommandId::SEQ;
    if (w == "help" || w == "?")        return CommandId::HELP;
    if (w == "quit" || w == "q" || w == "exit") return CommandId::QUIT;
    return CommandId::UNKNOWN;
}

const char* CommandIdStr(CommandId id) {
    switch (id) {
        case CommandId::START:     return "START";
        case CommandId::STOP:      return "STOP";
        case CommandId::CALIBRATE: return "CALIBRATE";
        case CommandId::RESET:     return "RESET";
        case CommandId::ARM:       return "ARM";
        case CommandId::UNDO:      return "UNDO";
        case CommandId::SEQ:       return "SEQ";
        case CommandId::HELP:      return "HELP";
        case CommandId::QUIT:      return "QUIT";
        default:                   return "UNKNOWN";
    }
}

void CommandHandler::printHelp() {
    std::cout << "[CMD] commands: start | stop | calibrate | reset | arm | undo | seq | help | quit\n";
}

bool CommandHandler::forward(det::CmdQueue& cmd_out, det::DetCmdType type) {
    det::DetCmd cmd{};
    cmd.type = type;
    if (!cmd_out.send(cmd, SEND_TIMEOUT_MS)) {
        std::cerr << "[CMD] detector command queue full, dropped "
                  << det::DetCmdTypeStr(type) << "\n";
        return false;
    }
    return true;
}

bool CommandHandler::handleLine(const std::string& line, det::CmdQueue& cmd_out,
                                det::DetectorTask* detector) {
    const CommandId id = parseCommand(line);

    switch (id) {
        case CommandId::START:  (void)forward(cmd_out, det::DetCmdType::Start); break;
        case CommandId::STOP:   (void)forward(cmd_out, det::DetCmdType::Stop);  break;
        case CommandId::RESET:  (void)forward(cmd_out, det::DetCmdType::Reset); break;
        case CommandId::ARM:    (void)forward(cmd_out, det::DetCmdType::Arm);   break;
        case CommandId::UNDO:   (void)forward(cmd_out, det::DetCmdType::Undo);  break;

        case CommandId::CALIBRATE:
            if (detector) {
                std::cout << "[CMD] calibrating, keep the board still...\n";
                if (detector->Calibrate(cmd_out, CALIBRATE_TIMEOUT_MS)) {
                    std::cout << "[CMD] calibration done\n";
                }
            } else {
                (void)forward(cmd_out, det::DetCmdType::Calibrate);
            }
            break;

        case CommandId::SEQ:
            if (detector) {
                const std::string text = detector->SequenceText();
                std::cout << "[CMD] sequence: " << (text.empty() ? "(empty)" : text) << "\n";
            }
            break;

        case CommandId::HELP:
            printHelp();
            break;

        case CommandId::QUIT:
            (void)forward(cmd_out, det::DetCmdType::Quit);
            m_quit.store(true);
            return false;

        case CommandId::UNKNOWN:
        default:
            if (!trimLower(line).empty()) {
                std::cout << "[CMD] unknown command '" << line << "'\n";
                printHelp();
            }
            break;
    }
    return true;
}

void CommandHandler::TaskEntry(void* arg) {
    auto* ctx = static_cast<TaskCtx*>(arg);
    if (!ctx || !ctx->self || !ctx->cmd_out) {
        std::cerr << "[CMD] TaskEntry: incomplete context\n";
        return;
    }

    std::istream& in = ctx->in ? *ctx->in : std::cin;
    printHelp();

    std::string line;
    while (std::getline(in, line)) {
        if (!ctx->self->handleLine(line, *ctx->cmd_out, ctx->detector)) break;
    }
    // EOF on stdin leaves the detector running; only 'quit' ends the session.
}

} // namespace core
