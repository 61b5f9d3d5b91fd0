/**
 * @file ChunkHandler.cpp
 * @brief File chunks: validate, record receipt, ACK and cumulative ACK
 */

#include "ReliabilityEngine.h"
#include "Base64.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

namespace ChatCast {

DispatchResult ReliabilityEngine::handleFileChunk(const FileChunkFrame& frame, const std::string& senderId,
                                                  IReplySink& sink) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();
    metrics.incrementChunksReceived();

    DispatchResult result;
    result.handled = FrameKind::FILE_CHUNK;
    result.sequence = frame.sequence;

    if (frame.transferId.empty()) {
        std::string reason = Core::reasonToken(Core::ErrorCode::MISSING_TRANSFER_ID);

        ControlFrame nack = ControlFrame::make(ControlCommand::NACK);
        nack.sequence = frame.sequence;
        nack.reason = reason;
        emit(nack, sink);

        logger.warn("Chunk seq=" + std::to_string(frame.sequence) + " from " + senderId +
                    " has no transfer id", "ReliabilityEngine");
        result.command = ControlCommand::NACK;
        result.commandName = nack.commandName;
        result.reason = reason;
        return result;
    }
    result.transferId = frame.transferId;

    auto decoded = Base64::decode(frame.payloadBase64);
    if (decoded.isError()) {
        std::string reason = Core::reasonToken(Core::ErrorCode::INVALID_ENCODING);

        ControlFrame nack = ControlFrame::make(ControlCommand::NACK);
        nack.sequence = frame.sequence;
        nack.transferId = frame.transferId;
        nack.reason = reason;
        emit(nack, sink);

        logger.warn("Chunk " + frame.transferId + "#" + std::to_string(frame.sequence) + " from " +
                    senderId + " rejected: " + decoded.error().message, "ReliabilityEngine");
        result.command = ControlCommand::NACK;
        result.commandName = nack.commandName;
        result.reason = reason;
        return result;
    }
    const std::vector<uint8_t>& payload = decoded.value();

    std::string expected = codec_.tag(payload, frame.sequence);
    if (!codec_.matches(expected, frame.integrityTag)) {
        std::string reason = Core::reasonToken(Core::ErrorCode::INTEGRITY_COMPROMISED);

        ControlFrame fail = ControlFrame::make(ControlCommand::INTEGRITY_FAIL);
        fail.sequence = frame.sequence;
        fail.transferId = frame.transferId;
        fail.reason = reason;
        if (!codec_.isKeyed()) {
            fail.expectedTag = expected;
        }
        fail.receivedTag = frame.integrityTag;
        emit(fail, sink);

        logger.warn("Integrity check failed for chunk " + frame.transferId + "#" +
                    std::to_string(frame.sequence) + " from " + senderId + " (received " +
                    frame.integrityTag + ")", "ReliabilityEngine");
        result.command = ControlCommand::INTEGRITY_FAIL;
        result.commandName = fail.commandName;
        result.reason = reason;
        return result;
    }

    TransferMeta meta;
    meta.totalChunks = frame.totalChunks;
    meta.chunkSizeHint = frame.chunkSizeHint;
    meta.filename = frame.filename;
    meta.totalSize = frame.totalSize;

    auto [state, created] = registry_.getOrCreate(frame.transferId, meta);
    if (created) {
        metrics.incrementTransfersStarted();
        logger.info("Transfer " + frame.transferId + " started by " + senderId + " (" +
                    std::to_string(meta.totalChunks) + " chunks, " + std::to_string(meta.totalSize) +
                    " bytes, file '" + meta.filename + "')", "ReliabilityEngine");
    }

    ReceiptUpdate update = state->recordReceived(frame.sequence);
    if (!update.inserted) {
        metrics.incrementDuplicateChunks();
        LOG_DEBUG_COMP_IF("Duplicate chunk " + frame.transferId + "#" + std::to_string(frame.sequence),
                          "ReliabilityEngine");
    }

    ControlFrame ack = ControlFrame::make(ControlCommand::ACK);
    ack.sequence = frame.sequence;
    ack.transferId = frame.transferId;
    ack.integrityStatus = "valid";
    if (!codec_.isKeyed()) {
        ack.expectedTag = expected;
    }
    ack.receivedTag = frame.integrityTag;
    emit(ack, sink);

    LOG_DEBUG_COMP_IF("ACK chunk " + frame.transferId + "#" + std::to_string(frame.sequence) +
                      " (contiguous through " + std::to_string(update.highestContiguous) + ")",
                      "ReliabilityEngine");

    // Meta is fixed by the first chunk, not by this frame
    uint32_t totalChunks = state->meta().totalChunks;
    if (totalChunks != 0) {
        bool onInterval = options_.cumAckInterval != 0 &&
                          frame.sequence % options_.cumAckInterval == 0;
        // Re-sent on every chunk that finds the transfer complete, so a lost
        // completion CUM_ACK is recovered by retransmitting any chunk
        if (onInterval || update.complete) {
            ControlFrame cumAck = ControlFrame::make(ControlCommand::CUM_ACK);
            cumAck.sequence = update.highestContiguous;
            cumAck.transferId = frame.transferId;
            emit(cumAck, sink);
        }
    }

    if (update.justCompleted) {
        metrics.incrementTransfersCompleted();
        logger.info("Transfer " + frame.transferId + " complete (" + std::to_string(totalChunks) +
                    " chunks)", "ReliabilityEngine");
    }

    result.command = ControlCommand::ACK;
    result.commandName = ack.commandName;
    return result;
}

} // namespace ChatCast
