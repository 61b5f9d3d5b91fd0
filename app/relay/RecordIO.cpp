#include "RecordIO.h"
#include "ErrorCodes.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sys/socket.h>
#include <sys/types.h>

namespace ChatCast {
namespace RecordIO {

namespace {

    const char* COMPONENT = "RecordIO";

    VoidResult sendAll(int fd, const char* data, size_t len) {
        while (len > 0) {
            ssize_t sent = ::send(fd, data, len, MSG_NOSIGNAL);
            if (sent < 0) {
                if (errno == EINTR) continue;
                return Core::makeError(Core::ErrorCode::SEND_FAILED,
                                       std::string("send failed: ") + std::strerror(errno), COMPONENT);
            }
            data += sent;
            len -= static_cast<size_t>(sent);
        }
        return Ok();
    }

    // Returns bytes read; less than len only at end of stream.
    Result<size_t> recvAll(int fd, char* data, size_t len) {
        size_t total = 0;
        while (total < len) {
            ssize_t received = ::recv(fd, data + total, len - total, 0);
            if (received == 0) {
                break;
            }
            if (received < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return Core::makeError(Core::ErrorCode::TIMEOUT, "receive timed out", COMPONENT);
                }
                return Core::makeError(Core::ErrorCode::CONNECTION_FAILED,
                                       std::string("recv failed: ") + std::strerror(errno), COMPONENT);
            }
            total += static_cast<size_t>(received);
        }
        return total;
    }

}

VoidResult writeRecord(int fd, const std::string& record) {
    if (record.size() > UINT32_MAX) {
        return Core::makeError(Core::ErrorCode::FRAME_TOO_LARGE,
                               "record of " + std::to_string(record.size()) + " bytes", COMPONENT);
    }

    uint32_t netLen = htonl(static_cast<uint32_t>(record.size()));
    std::string buffer(reinterpret_cast<const char*>(&netLen), sizeof(netLen));
    buffer += record;
    return sendAll(fd, buffer.data(), buffer.size());
}

Result<std::string> readRecord(int fd, size_t maxBytes) {
    uint32_t netLen = 0;
    auto header = recvAll(fd, reinterpret_cast<char*>(&netLen), sizeof(netLen));
    if (header.isError()) {
        return header.error();
    }
    if (header.value() == 0) {
        return Core::makeError(Core::ErrorCode::CONNECTION_CLOSED, "connection closed", COMPONENT);
    }
    if (header.value() < sizeof(netLen)) {
        return Core::makeError(Core::ErrorCode::CONNECTION_CLOSED, "connection closed inside length prefix",
                               COMPONENT);
    }

    uint32_t len = ntohl(netLen);
    if (len > maxBytes) {
        return Core::makeError(Core::ErrorCode::FRAME_TOO_LARGE,
                               "record of " + std::to_string(len) + " bytes exceeds limit of " +
                               std::to_string(maxBytes), COMPONENT);
    }

    std::string record(len, '\0');
    auto body = recvAll(fd, &record[0], len);
    if (body.isError()) {
        return body.error();
    }
    if (body.value() < len) {
        return Core::makeError(Core::ErrorCode::CONNECTION_CLOSED, "connection closed inside record",
                               COMPONENT);
    }
    return record;
}

}
} // namespace ChatCast
