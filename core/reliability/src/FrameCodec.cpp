#include "FrameCodec.h"
#include "ErrorCodes.h"

#include <cstdint>
#include <memory>
#include <sstream>

#include <json/json.h>

namespace ChatCast {

namespace {

    const char* COMPONENT = "FrameCodec";

    Error fieldError(const std::string& key, const std::string& expected) {
        return Core::makeError(Core::ErrorCode::INVALID_FIELD,
                               "field '" + key + "' must be " + expected, COMPONENT);
    }

    // Each reader leaves `out` untouched when the key is absent or null.

    std::optional<Error> readString(const Json::Value& obj, const char* key, std::string& out) {
        const Json::Value& v = obj[key];
        if (v.isNull()) {
            return std::nullopt;
        }
        if (!v.isString()) {
            return fieldError(key, "a string");
        }
        out = v.asString();
        return std::nullopt;
    }

    std::optional<Error> readUnsigned(const Json::Value& obj, const char* key, uint64_t max, uint64_t& out) {
        const Json::Value& v = obj[key];
        if (v.isNull()) {
            return std::nullopt;
        }
        if (!v.isIntegral() || !v.isUInt64() || v.asUInt64() > max) {
            return fieldError(key, "an integer in [0, " + std::to_string(max) + "]");
        }
        out = v.asUInt64();
        return std::nullopt;
    }

    std::optional<Error> readUInt32(const Json::Value& obj, const char* key, uint32_t& out) {
        uint64_t value = out;
        if (auto err = readUnsigned(obj, key, UINT32_MAX, value)) {
            return err;
        }
        out = static_cast<uint32_t>(value);
        return std::nullopt;
    }

    std::optional<Error> readOptionalString(const Json::Value& obj, const char* key,
                                            std::optional<std::string>& out) {
        if (obj[key].isNull()) {
            return std::nullopt;
        }
        std::string value;
        if (auto err = readString(obj, key, value)) {
            return err;
        }
        out = std::move(value);
        return std::nullopt;
    }

    Result<Frame> decodeMessage(const Json::Value& root) {
        MessageFrame frame;
        std::string payload;
        std::optional<std::string> checksum;

        if (auto err = readUInt32(root, "seq", frame.sequence)) return *err;
        if (auto err = readString(root, "payload", payload)) return *err;
        if (auto err = readOptionalString(root, "checksum", checksum)) return *err;

        frame.payload.assign(payload.begin(), payload.end());
        if (checksum && !checksum->empty()) {
            frame.integrityTag = std::move(checksum);
        }
        return Frame(std::move(frame));
    }

    Result<Frame> decodeFileChunk(const Json::Value& root) {
        FileChunkFrame frame;

        if (auto err = readString(root, "transfer_id", frame.transferId)) return *err;
        if (auto err = readUInt32(root, "seq", frame.sequence)) return *err;
        if (auto err = readUInt32(root, "total_chunks", frame.totalChunks)) return *err;
        if (auto err = readUInt32(root, "chunk_size", frame.chunkSizeHint)) return *err;
        if (auto err = readString(root, "filename", frame.filename)) return *err;
        if (auto err = readUnsigned(root, "total_size", UINT64_MAX, frame.totalSize)) return *err;
        if (auto err = readString(root, "checksum", frame.integrityTag)) return *err;
        if (auto err = readString(root, "payload_b64", frame.payloadBase64)) return *err;

        return Frame(std::move(frame));
    }

    Result<Frame> decodeControl(const Json::Value& root) {
        ControlFrame frame;

        if (auto err = readString(root, "cmd", frame.commandName)) return *err;
        frame.command = parseControlCommand(frame.commandName);
        if (auto err = readOptionalString(root, "transfer_id", frame.transferId)) return *err;

        const Json::Value& seq = root["seq"];
        if (!seq.isNull()) {
            if (!seq.isIntegral() || !seq.isInt64()) {
                return fieldError("seq", "an integer");
            }
            frame.sequence = seq.asInt64();
        }

        const Json::Value& meta = root["meta"];
        if (meta.isNull()) {
            return Frame(std::move(frame));
        }
        if (!meta.isObject()) {
            return fieldError("meta", "an object");
        }

        if (auto err = readOptionalString(meta, "reason", frame.reason)) return *err;
        if (auto err = readOptionalString(meta, "expected", frame.expectedTag)) return *err;
        if (auto err = readOptionalString(meta, "received", frame.receivedTag)) return *err;
        if (auto err = readOptionalString(meta, "integrity_status", frame.integrityStatus)) return *err;

        const Json::Value& missing = meta["missing"];
        if (!missing.isNull()) {
            if (!missing.isArray()) {
                return fieldError("missing", "an array");
            }
            frame.missing.reserve(missing.size());
            for (const auto& item : missing) {
                if (!item.isIntegral() || !item.isUInt64() || item.asUInt64() > UINT32_MAX) {
                    return fieldError("missing", "an array of sequence numbers");
                }
                frame.missing.push_back(static_cast<uint32_t>(item.asUInt64()));
            }
        }
        return Frame(std::move(frame));
    }

    bool parseDocument(const std::string& text, Json::Value& root, std::string& errors) {
        Json::CharReaderBuilder builder;
        Json::CharReaderBuilder::strictMode(&builder.settings_);
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        return reader->parse(text.data(), text.data() + text.size(), &root, &errors);
    }

    std::string write(const Json::Value& value) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, value);
    }

    Json::Value controlToJson(const ControlFrame& frame) {
        Json::Value root(Json::objectValue);
        root["type"] = frameKindName(FrameKind::CONTROL);
        root["cmd"] = frame.commandName.empty() ? controlCommandName(frame.command) : frame.commandName;
        if (frame.transferId) {
            root["transfer_id"] = *frame.transferId;
        }
        if (frame.sequence) {
            root["seq"] = static_cast<Json::Int64>(*frame.sequence);
        }

        Json::Value meta(Json::objectValue);
        if (frame.reason) meta["reason"] = *frame.reason;
        if (frame.expectedTag) meta["expected"] = *frame.expectedTag;
        if (frame.receivedTag) meta["received"] = *frame.receivedTag;
        if (frame.integrityStatus) meta["integrity_status"] = *frame.integrityStatus;
        if (!frame.missing.empty() || frame.command == ControlCommand::MISSING) {
            Json::Value list(Json::arrayValue);
            for (uint32_t seq : frame.missing) {
                list.append(Json::UInt(seq));
            }
            meta["missing"] = list;
        }
        if (!meta.empty()) {
            root["meta"] = meta;
        }
        return root;
    }

}

Result<Frame> FrameCodec::decode(const std::string& text) {
    Json::Value root;
    std::string errors;
    if (!parseDocument(text, root, errors)) {
        std::string detail = errors;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' ')) {
            detail.pop_back();
        }
        return Core::makeError(Core::ErrorCode::MALFORMED_FRAME, "malformed JSON: " + detail, COMPONENT);
    }
    if (!root.isObject()) {
        return Core::makeError(Core::ErrorCode::MALFORMED_FRAME, "frame is not a JSON object", COMPONENT);
    }

    const Json::Value& type = root["type"];
    if (!type.isString()) {
        return Core::makeError(Core::ErrorCode::UNKNOWN_FRAME_TYPE, "frame has no string 'type'", COMPONENT);
    }

    std::string typeName = type.asString();
    if (typeName == frameKindName(FrameKind::MESSAGE)) {
        return decodeMessage(root);
    }
    if (typeName == frameKindName(FrameKind::FILE_CHUNK)) {
        return decodeFileChunk(root);
    }
    if (typeName == frameKindName(FrameKind::CONTROL)) {
        return decodeControl(root);
    }
    return Core::makeError(Core::ErrorCode::UNKNOWN_FRAME_TYPE, "unknown frame type '" + typeName + "'",
                           COMPONENT);
}

std::string FrameCodec::encode(const Frame& frame) {
    if (const auto* msg = std::get_if<MessageFrame>(&frame)) {
        Json::Value root(Json::objectValue);
        root["type"] = frameKindName(FrameKind::MESSAGE);
        root["seq"] = Json::UInt(msg->sequence);
        root["payload"] = std::string(msg->payload.begin(), msg->payload.end());
        if (msg->integrityTag) {
            root["checksum"] = *msg->integrityTag;
        }
        return write(root);
    }

    if (const auto* chunk = std::get_if<FileChunkFrame>(&frame)) {
        Json::Value root(Json::objectValue);
        root["type"] = frameKindName(FrameKind::FILE_CHUNK);
        root["transfer_id"] = chunk->transferId;
        root["seq"] = Json::UInt(chunk->sequence);
        root["total_chunks"] = Json::UInt(chunk->totalChunks);
        root["chunk_size"] = Json::UInt(chunk->chunkSizeHint);
        root["filename"] = chunk->filename;
        root["total_size"] = Json::UInt64(chunk->totalSize);
        root["checksum"] = chunk->integrityTag;
        root["payload_b64"] = chunk->payloadBase64;
        return write(root);
    }

    return write(controlToJson(std::get<ControlFrame>(frame)));
}

std::string FrameCodec::encodeControl(const ControlFrame& frame) {
    return write(controlToJson(frame));
}

std::optional<int64_t> FrameCodec::peekSequence(const std::string& text) {
    Json::Value root;
    std::string errors;
    if (!parseDocument(text, root, errors) || !root.isObject()) {
        return std::nullopt;
    }
    const Json::Value& seq = root["seq"];
    if (seq.isIntegral() && seq.isInt64()) {
        return seq.asInt64();
    }
    return std::nullopt;
}

} // namespace ChatCast
