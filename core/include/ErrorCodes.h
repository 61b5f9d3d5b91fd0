#pragma once

#include "Result.h"
#include <string>

namespace ChatCast {
namespace Core {

enum class ErrorCode : int {
    // Frame Errors (1000-1999)
    MALFORMED_FRAME = 1000,
    UNKNOWN_FRAME_TYPE = 1001,
    INVALID_FIELD = 1002,
    FRAME_TOO_LARGE = 1003,

    // Protocol Errors (2000-2999)
    MISSING_TRANSFER_ID = 2000,
    INVALID_ENCODING = 2001,
    INTEGRITY_COMPROMISED = 2002,

    // Transport Errors (3000-3999)
    CONNECTION_FAILED = 3000,
    CONNECTION_CLOSED = 3001,
    SEND_FAILED = 3002,
    TIMEOUT = 3003,

    // System Errors (5000-5999)
    INTERNAL_ERROR = 5001,
    INVALID_CONFIGURATION = 5002,

    // Success
    SUCCESS = 0
};

std::string errorCodeToString(ErrorCode code);

/**
 * @brief Protocol reason token carried in NACK / INTEGRITY_FAIL meta.
 *
 * Only the protocol-level codes have tokens; every other code maps to
 * "internal_error".
 */
std::string reasonToken(ErrorCode code);

inline Error makeError(ErrorCode code, std::string message, std::string component = "") {
    return Error(std::move(message), static_cast<int>(code), std::move(component));
}

} // namespace Core
} // namespace ChatCast
