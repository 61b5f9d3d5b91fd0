#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ChatCast {

/**
 * @brief Control commands exchanged on the reliability channel.
 *
 * UNKNOWN stands for any command name this build does not recognise; the
 * original name is kept in ControlFrame::commandName.
 */
enum class ControlCommand {
    ACK,
    NACK,
    CUM_ACK,
    MISSING,
    INTEGRITY_FAIL,
    RESUME_REQUEST,
    UNKNOWN
};

const char* controlCommandName(ControlCommand command);
ControlCommand parseControlCommand(const std::string& name);

enum class FrameKind {
    MESSAGE,
    FILE_CHUNK,
    CONTROL
};

const char* frameKindName(FrameKind kind);

/**
 * @brief Short chat message. Never tracked for gaps.
 */
struct MessageFrame {
    uint32_t sequence{0};
    std::vector<uint8_t> payload;
    std::optional<std::string> integrityTag;
};

/**
 * @brief One chunk of a file transfer. The payload is still base64 text;
 * the engine decodes it so that a bad encoding is reported per chunk.
 */
struct FileChunkFrame {
    std::string transferId;
    uint32_t sequence{0};
    uint32_t totalChunks{0};
    uint32_t chunkSizeHint{0};
    std::string filename;
    uint64_t totalSize{0};
    std::string integrityTag;
    std::string payloadBase64;
};

/**
 * @brief Control frame, inbound (RESUME_REQUEST, ...) or emitted by the engine.
 *
 * Sequences are signed 64-bit: every uint32 chunk sequence fits, and -1 is
 * the "nothing received yet" sentinel.
 */
struct ControlFrame {
    ControlCommand command{ControlCommand::UNKNOWN};
    std::string commandName;
    std::optional<std::string> transferId;
    std::optional<int64_t> sequence;

    // meta
    std::optional<std::string> reason;
    std::optional<std::string> expectedTag;
    std::optional<std::string> receivedTag;
    std::optional<std::string> integrityStatus;
    std::vector<uint32_t> missing;

    static ControlFrame make(ControlCommand command);
};

using Frame = std::variant<MessageFrame, FileChunkFrame, ControlFrame>;

FrameKind frameKind(const Frame& frame);

/**
 * @brief Sequence carried by a frame, if any (controls may omit it).
 */
std::optional<int64_t> frameSequence(const Frame& frame);

} // namespace ChatCast
