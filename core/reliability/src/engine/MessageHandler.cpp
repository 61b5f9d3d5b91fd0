/**
 * @file MessageHandler.cpp
 * @brief Chat messages: verify the optional tag and acknowledge
 */

#include "ReliabilityEngine.h"
#include "ErrorCodes.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

namespace ChatCast {

DispatchResult ReliabilityEngine::handleMessage(const MessageFrame& frame, const std::string& senderId,
                                                IReplySink& sink) {
    MetricsCollector::instance().incrementMessagesReceived();

    DispatchResult result;
    result.handled = FrameKind::MESSAGE;
    result.sequence = frame.sequence;

    // An empty tag is treated as no tag at all
    if (!frame.integrityTag || frame.integrityTag->empty()) {
        ControlFrame ack = ControlFrame::make(ControlCommand::ACK);
        ack.sequence = frame.sequence;
        emit(ack, sink);

        LOG_DEBUG_COMP_IF("ACK msg seq=" + std::to_string(frame.sequence) + " to " + senderId,
                          "ReliabilityEngine");
        result.command = ControlCommand::ACK;
        result.commandName = ack.commandName;
        return result;
    }

    const std::string& received = *frame.integrityTag;
    std::string expected = codec_.tag(frame.payload, frame.sequence);

    if (!codec_.matches(expected, received)) {
        std::string reason = Core::reasonToken(Core::ErrorCode::INTEGRITY_COMPROMISED);

        ControlFrame fail = ControlFrame::make(ControlCommand::INTEGRITY_FAIL);
        fail.sequence = frame.sequence;
        fail.reason = reason;
        if (!codec_.isKeyed()) {
            fail.expectedTag = expected;
        }
        fail.receivedTag = received;
        emit(fail, sink);

        LOG_WARN_COMP("Integrity check failed for message seq=" + std::to_string(frame.sequence) +
                      " from " + senderId + " (received " + received + ")", "ReliabilityEngine");
        result.command = ControlCommand::INTEGRITY_FAIL;
        result.commandName = fail.commandName;
        result.reason = reason;
        return result;
    }

    ControlFrame ack = ControlFrame::make(ControlCommand::ACK);
    ack.sequence = frame.sequence;
    ack.integrityStatus = "valid";
    if (!codec_.isKeyed()) {
        ack.expectedTag = expected;
    }
    ack.receivedTag = received;
    emit(ack, sink);

    LOG_DEBUG_COMP_IF("ACK msg seq=" + std::to_string(frame.sequence) + " (verified) to " + senderId,
                      "ReliabilityEngine");
    result.command = ControlCommand::ACK;
    result.commandName = ack.commandName;
    return result;
}

} // namespace ChatCast
