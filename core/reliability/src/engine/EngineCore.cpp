/**
 * @file EngineCore.cpp
 * @brief Dispatch boundary, reply emission and internal-error reporting
 */

#include "ReliabilityEngine.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

#include <exception>

namespace ChatCast {

ReliabilityEngine::ReliabilityEngine(TransferRegistry& registry, const IIntegrityCodec& codec)
    : ReliabilityEngine(registry, codec, Options{}) {
}

ReliabilityEngine::ReliabilityEngine(TransferRegistry& registry, const IIntegrityCodec& codec,
                                     Options options)
    : registry_(registry), codec_(codec), options_(options) {
    Logger::instance().info(std::string("Reliability engine ready (integrity: ") + codec_.name() +
                            ", cumulative ack every " + std::to_string(options_.cumAckInterval) +
                            " chunks)", "ReliabilityEngine");
}

DispatchResult ReliabilityEngine::dispatch(const Frame& frame, const std::string& senderId,
                                           IReplySink& sink) {
    FrameKind kind = frameKind(frame);
    try {
        switch (kind) {
            case FrameKind::MESSAGE:
                return handleMessage(std::get<MessageFrame>(frame), senderId, sink);
            case FrameKind::FILE_CHUNK:
                return handleFileChunk(std::get<FileChunkFrame>(frame), senderId, sink);
            case FrameKind::CONTROL:
                return handleControl(std::get<ControlFrame>(frame), senderId, sink);
        }
        return sendInternalError(kind, "unhandled frame kind", frameSequence(frame), senderId, sink);
    } catch (const std::exception& e) {
        return sendInternalError(kind, e.what(), frameSequence(frame), senderId, sink);
    } catch (...) {
        return sendInternalError(kind, "unknown exception", frameSequence(frame), senderId, sink);
    }
}

DispatchResult ReliabilityEngine::reportUndecodable(const std::string& detail,
                                                    std::optional<int64_t> sequence,
                                                    const std::string& senderId,
                                                    IReplySink& sink) {
    MetricsCollector::instance().incrementUndecodableFrames();
    return sendInternalError(FrameKind::CONTROL, detail, sequence, senderId, sink);
}

DispatchResult ReliabilityEngine::sendInternalError(FrameKind kind, const std::string& detail,
                                                    std::optional<int64_t> sequence,
                                                    const std::string& senderId,
                                                    IReplySink& sink) {
    MetricsCollector::instance().incrementInternalErrors();

    std::string reason = Core::reasonToken(Core::ErrorCode::INTERNAL_ERROR) + ":" + detail;
    Logger::instance().error("Frame from " + senderId + " failed: " + reason, "ReliabilityEngine");

    ControlFrame nack = ControlFrame::make(ControlCommand::NACK);
    nack.sequence = sequence.value_or(-1);
    nack.reason = reason;

    // The reply path itself may be what failed; report and give up on this frame.
    try {
        emit(nack, sink);
    } catch (const std::exception& e) {
        Logger::instance().error("Could not deliver NACK to " + senderId + ": " + e.what(),
                                 "ReliabilityEngine");
    } catch (...) {
        Logger::instance().error("Could not deliver NACK to " + senderId + ": unknown exception",
                                 "ReliabilityEngine");
    }

    DispatchResult result;
    result.handled = kind;
    result.command = ControlCommand::NACK;
    result.commandName = controlCommandName(ControlCommand::NACK);
    result.sequence = nack.sequence;
    result.reason = reason;
    return result;
}

void ReliabilityEngine::emit(const ControlFrame& reply, IReplySink& sink) {
    auto& metrics = MetricsCollector::instance();
    switch (reply.command) {
        case ControlCommand::ACK: metrics.incrementAcksSent(); break;
        case ControlCommand::CUM_ACK: metrics.incrementCumulativeAcksSent(); break;
        case ControlCommand::NACK: metrics.incrementNacksSent(); break;
        case ControlCommand::MISSING: metrics.incrementMissingReportsSent(); break;
        case ControlCommand::INTEGRITY_FAIL: metrics.incrementIntegrityFailures(); break;
        default: break;
    }
    sink.send(reply);
}

} // namespace ChatCast
