#include "ErrorCodes.h"

namespace ChatCast {
namespace Core {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::MALFORMED_FRAME: return "MALFORMED_FRAME";
        case ErrorCode::UNKNOWN_FRAME_TYPE: return "UNKNOWN_FRAME_TYPE";
        case ErrorCode::INVALID_FIELD: return "INVALID_FIELD";
        case ErrorCode::FRAME_TOO_LARGE: return "FRAME_TOO_LARGE";

        case ErrorCode::MISSING_TRANSFER_ID: return "MISSING_TRANSFER_ID";
        case ErrorCode::INVALID_ENCODING: return "INVALID_ENCODING";
        case ErrorCode::INTEGRITY_COMPROMISED: return "INTEGRITY_COMPROMISED";

        case ErrorCode::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ErrorCode::CONNECTION_CLOSED: return "CONNECTION_CLOSED";
        case ErrorCode::SEND_FAILED: return "SEND_FAILED";
        case ErrorCode::TIMEOUT: return "TIMEOUT";

        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";

        case ErrorCode::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

std::string reasonToken(ErrorCode code) {
    switch (code) {
        case ErrorCode::MISSING_TRANSFER_ID: return "missing_transfer_id";
        case ErrorCode::INVALID_ENCODING: return "invalid_encoding";
        case ErrorCode::INTEGRITY_COMPROMISED: return "integrity_compromised";
        default: return "internal_error";
    }
}

} // namespace Core
} // namespace ChatCast
