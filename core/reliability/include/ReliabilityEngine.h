#pragma once

#include "Frame.h"
#include "IReplySink.h"
#include "IntegrityCodec.h"
#include "TransferRegistry.h"

#include <cstdint>
#include <optional>
#include <string>

namespace ChatCast {

/**
 * @brief What dispatch() did with one inbound frame.
 *
 * For messages and chunks, command is the primary reply (ACK, NACK or
 * INTEGRITY_FAIL). For controls, command is the inbound command and
 * commandName its name as received, so unrecognised commands are echoed.
 */
struct DispatchResult {
    FrameKind handled{FrameKind::CONTROL};
    std::optional<ControlCommand> command;
    std::string commandName;
    std::optional<int64_t> sequence;
    std::optional<std::string> reason;
    std::optional<std::string> transferId;
};

/**
 * @brief Receiver side of the reliability protocol.
 *
 * Applies the message, file chunk and control rules to one decoded frame at
 * a time and emits the resulting control frames through the supplied reply
 * sink. Safe to call concurrently from many threads; the only shared state is
 * the TransferRegistry. dispatch() never throws: unexpected failures become a
 * NACK with reason "internal_error:<detail>".
 */
class ReliabilityEngine {
public:
    struct Options {
        uint32_t cumAckInterval{4};
    };

    ReliabilityEngine(TransferRegistry& registry, const IIntegrityCodec& codec);
    ReliabilityEngine(TransferRegistry& registry, const IIntegrityCodec& codec, Options options);

    ReliabilityEngine(const ReliabilityEngine&) = delete;
    ReliabilityEngine& operator=(const ReliabilityEngine&) = delete;

    DispatchResult dispatch(const Frame& frame, const std::string& senderId, IReplySink& sink);

    /**
     * @brief Answer a record the transport could not decode into a Frame.
     * @param sequence Sequence recovered from the raw record, if any
     */
    DispatchResult reportUndecodable(const std::string& detail,
                                     std::optional<int64_t> sequence,
                                     const std::string& senderId,
                                     IReplySink& sink);

    TransferRegistry& registry() { return registry_; }
    const IIntegrityCodec& codec() const { return codec_; }
    const Options& options() const { return options_; }

private:
    DispatchResult handleMessage(const MessageFrame& frame, const std::string& senderId, IReplySink& sink);
    DispatchResult handleFileChunk(const FileChunkFrame& frame, const std::string& senderId, IReplySink& sink);
    DispatchResult handleControl(const ControlFrame& frame, const std::string& senderId, IReplySink& sink);

    DispatchResult handleResumeRequest(const std::string& transferId, const std::string& senderId,
                                       IReplySink& sink);

    DispatchResult sendInternalError(FrameKind kind, const std::string& detail,
                                     std::optional<int64_t> sequence,
                                     const std::string& senderId, IReplySink& sink);

    void emit(const ControlFrame& reply, IReplySink& sink);

    TransferRegistry& registry_;
    const IIntegrityCodec& codec_;
    Options options_;
};

} // namespace ChatCast
