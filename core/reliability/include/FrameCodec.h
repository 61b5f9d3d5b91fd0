#pragma once

#include "Frame.h"
#include "Result.h"

#include <cstdint>
#include <optional>
#include <string>

namespace ChatCast {

/**
 * @brief JSON wire form of frames (jsoncpp).
 *
 * Field names: type, seq, payload, checksum, transfer_id, total_chunks,
 * chunk_size, filename, total_size, payload_b64, cmd and meta{reason,
 * expected, received, integrity_status, missing}. Unknown fields are ignored.
 */
class FrameCodec {
public:
    /**
     * @brief Parse one JSON document into a Frame.
     *
     * Fails on malformed JSON, non-object documents, unknown "type" values,
     * wrong field types and numbers outside the field's range. Missing
     * numbers read as 0, missing strings as "".
     */
    static Result<Frame> decode(const std::string& text);

    static std::string encode(const Frame& frame);
    static std::string encodeControl(const ControlFrame& frame);

    /**
     * @brief Best-effort "seq" of a record that failed to decode.
     */
    static std::optional<int64_t> peekSequence(const std::string& text);
};

} // namespace ChatCast
