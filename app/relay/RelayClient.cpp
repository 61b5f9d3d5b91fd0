#include "RelayClient.h"
#include "ErrorCodes.h"
#include "FrameCodec.h"
#include "LoggerMacros.h"
#include "RecordIO.h"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace ChatCast {

namespace {
    const char* COMPONENT = "RelayClient";
}

RelayClient::RelayClient(size_t maxFrameBytes) : maxFrameBytes_(maxFrameBytes) {
}

VoidResult RelayClient::connect(const std::string& host, int port) {
    close();

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* resolved = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
        return Core::makeError(Core::ErrorCode::CONNECTION_FAILED,
                               "Cannot resolve " + host + ": " + gai_strerror(rc), COMPONENT);
    }

    std::string lastError = "no addresses";
    for (struct addrinfo* ai = resolved; ai != nullptr; ai = ai->ai_next) {
        SocketGuard sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock) {
            lastError = strerror(errno);
            continue;
        }
        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            lastError = strerror(errno);
            continue;
        }
        socket_ = std::move(sock);
        break;
    }
    freeaddrinfo(resolved);

    if (!socket_) {
        return Core::makeError(Core::ErrorCode::CONNECTION_FAILED,
                               "Failed to connect to " + host + ":" + std::to_string(port) + ": " + lastError,
                               COMPONENT);
    }

    LOG_DEBUG_COMP_IF("Connected to " + host + ":" + std::to_string(port), COMPONENT);
    return Ok();
}

void RelayClient::close() {
    socket_.reset();
}

VoidResult RelayClient::send(const Frame& frame) {
    return sendRaw(FrameCodec::encode(frame));
}

VoidResult RelayClient::sendRaw(const std::string& record) {
    if (!socket_) {
        return Core::makeError(Core::ErrorCode::CONNECTION_CLOSED, "not connected", COMPONENT);
    }
    return RecordIO::writeRecord(socket_.get(), record);
}

Result<ControlFrame> RelayClient::receive(std::chrono::milliseconds timeout) {
    if (!socket_) {
        return Core::makeError(Core::ErrorCode::CONNECTION_CLOSED, "not connected", COMPONENT);
    }

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(socket_.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return Core::makeError(Core::ErrorCode::CONNECTION_FAILED,
                               std::string("Failed to set receive timeout: ") + strerror(errno), COMPONENT);
    }

    auto record = RecordIO::readRecord(socket_.get(), maxFrameBytes_);
    if (record.isError()) {
        return record.error();
    }

    auto decoded = FrameCodec::decode(record.value());
    if (decoded.isError()) {
        return decoded.error();
    }
    if (auto* control = std::get_if<ControlFrame>(&decoded.value())) {
        return *control;
    }
    return Core::makeError(Core::ErrorCode::UNKNOWN_FRAME_TYPE,
                           std::string("expected a CONTROL frame, got ") + frameKindName(frameKind(decoded.value())),
                           COMPONENT);
}

std::vector<ControlFrame> RelayClient::drain(std::chrono::milliseconds idleTimeout) {
    std::vector<ControlFrame> frames;
    while (true) {
        auto next = receive(idleTimeout);
        if (next.isError()) {
            break;
        }
        frames.push_back(std::move(next.value()));
    }
    return frames;
}

} // namespace ChatCast
