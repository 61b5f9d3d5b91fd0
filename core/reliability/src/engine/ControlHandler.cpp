/**
 * @file ControlHandler.cpp
 * @brief Inbound control frames; only RESUME_REQUEST triggers a reply
 */

#include "ReliabilityEngine.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

namespace ChatCast {

DispatchResult ReliabilityEngine::handleControl(const ControlFrame& frame, const std::string& senderId,
                                                IReplySink& sink) {
    MetricsCollector::instance().incrementControlsReceived();

    if (frame.command == ControlCommand::RESUME_REQUEST && frame.transferId &&
        !frame.transferId->empty()) {
        DispatchResult result = handleResumeRequest(*frame.transferId, senderId, sink);
        result.sequence = frame.sequence;
        return result;
    }

    LOG_DEBUG_COMP_IF("Control '" + frame.commandName + "' from " + senderId + " needs no reply",
                      "ReliabilityEngine");

    DispatchResult result;
    result.handled = FrameKind::CONTROL;
    result.command = frame.command;
    result.commandName = frame.commandName;
    result.sequence = frame.sequence;
    result.transferId = frame.transferId;
    return result;
}

DispatchResult ReliabilityEngine::handleResumeRequest(const std::string& transferId,
                                                      const std::string& senderId,
                                                      IReplySink& sink) {
    auto& logger = Logger::instance();
    MetricsCollector::instance().incrementResumeRequests();

    DispatchResult result;
    result.handled = FrameKind::CONTROL;
    result.command = ControlCommand::RESUME_REQUEST;
    result.commandName = controlCommandName(ControlCommand::RESUME_REQUEST);
    result.transferId = transferId;

    auto state = registry_.get(transferId);
    if (!state) {
        ControlFrame cumAck = ControlFrame::make(ControlCommand::CUM_ACK);
        cumAck.sequence = -1;
        cumAck.transferId = transferId;
        emit(cumAck, sink);

        logger.info("Resume for unknown transfer " + transferId + " from " + senderId,
                    "ReliabilityEngine");
        return result;
    }

    state->touch();
    std::vector<uint32_t> missing = state->missing();
    if (!missing.empty()) {
        ControlFrame report = ControlFrame::make(ControlCommand::MISSING);
        report.transferId = transferId;
        report.missing = std::move(missing);
        emit(report, sink);

        logger.info("Resume for " + transferId + " from " + senderId + ": " +
                    std::to_string(report.missing.size()) + " chunks missing", "ReliabilityEngine");
        return result;
    }

    ControlFrame cumAck = ControlFrame::make(ControlCommand::CUM_ACK);
    cumAck.sequence = state->highestContiguous();
    cumAck.transferId = transferId;
    emit(cumAck, sink);

    logger.info("Resume for " + transferId + " from " + senderId + ": nothing missing",
                "ReliabilityEngine");
    return result;
}

} // namespace ChatCast
