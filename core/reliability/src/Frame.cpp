#include "Frame.h"

namespace ChatCast {

const char* controlCommandName(ControlCommand command) {
    switch (command) {
        case ControlCommand::ACK: return "ACK";
        case ControlCommand::NACK: return "NACK";
        case ControlCommand::CUM_ACK: return "CUM_ACK";
        case ControlCommand::MISSING: return "MISSING";
        case ControlCommand::INTEGRITY_FAIL: return "INTEGRITY_FAIL";
        case ControlCommand::RESUME_REQUEST: return "RESUME_REQUEST";
        default: return "UNKNOWN";
    }
}

ControlCommand parseControlCommand(const std::string& name) {
    if (name == "ACK") return ControlCommand::ACK;
    if (name == "NACK") return ControlCommand::NACK;
    if (name == "CUM_ACK") return ControlCommand::CUM_ACK;
    if (name == "MISSING") return ControlCommand::MISSING;
    if (name == "INTEGRITY_FAIL") return ControlCommand::INTEGRITY_FAIL;
    if (name == "RESUME_REQUEST") return ControlCommand::RESUME_REQUEST;
    return ControlCommand::UNKNOWN;
}

const char* frameKindName(FrameKind kind) {
    switch (kind) {
        case FrameKind::MESSAGE: return "MSG";
        case FrameKind::FILE_CHUNK: return "FILE_CHUNK";
        case FrameKind::CONTROL: return "CONTROL";
        default: return "UNKNOWN";
    }
}

ControlFrame ControlFrame::make(ControlCommand command) {
    ControlFrame frame;
    frame.command = command;
    frame.commandName = controlCommandName(command);
    return frame;
}

FrameKind frameKind(const Frame& frame) {
    if (std::holds_alternative<MessageFrame>(frame)) return FrameKind::MESSAGE;
    if (std::holds_alternative<FileChunkFrame>(frame)) return FrameKind::FILE_CHUNK;
    return FrameKind::CONTROL;
}

std::optional<int64_t> frameSequence(const Frame& frame) {
    if (const auto* msg = std::get_if<MessageFrame>(&frame)) {
        return static_cast<int64_t>(msg->sequence);
    }
    if (const auto* chunk = std::get_if<FileChunkFrame>(&frame)) {
        return static_cast<int64_t>(chunk->sequence);
    }
    return std::get<ControlFrame>(frame).sequence;
}

} // namespace ChatCast
