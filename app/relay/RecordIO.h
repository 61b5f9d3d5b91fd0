#pragma once

#include "Result.h"

#include <cstddef>
#include <string>

namespace ChatCast {

/**
 * @brief Length-prefixed records on a stream socket.
 *
 * Each record is a 4-byte big-endian length followed by that many bytes of
 * UTF-8 JSON.
 */
namespace RecordIO {

    /**
     * @brief Write one record; loops over short writes. Never raises SIGPIPE.
     */
    VoidResult writeRecord(int fd, const std::string& record);

    /**
     * @brief Read one record.
     *
     * CONNECTION_CLOSED on end of stream before a length prefix,
     * FRAME_TOO_LARGE if the announced length exceeds maxBytes, TIMEOUT if
     * the socket's receive timeout expires.
     */
    Result<std::string> readRecord(int fd, size_t maxBytes);

}

} // namespace ChatCast
