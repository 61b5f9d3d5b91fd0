#pragma once

#include "Frame.h"
#include "Result.h"
#include "SocketGuard.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace ChatCast {

/**
 * @brief Blocking client for the relay wire protocol.
 *
 * Used by chatcast_cli and the integration tests. Not thread-safe.
 */
class RelayClient {
public:
    explicit RelayClient(size_t maxFrameBytes = 16 * 1024 * 1024);

    VoidResult connect(const std::string& host, int port);
    void close();
    bool isConnected() const { return socket_.valid(); }

    VoidResult send(const Frame& frame);

    /**
     * @brief Send an already-encoded record (lets callers send invalid JSON)
     */
    VoidResult sendRaw(const std::string& record);

    /**
     * @brief Wait up to timeout for the next control frame from the relay
     */
    Result<ControlFrame> receive(std::chrono::milliseconds timeout);

    /**
     * @brief Collect control frames until none arrives within idleTimeout
     */
    std::vector<ControlFrame> drain(std::chrono::milliseconds idleTimeout);

private:
    SocketGuard socket_;
    size_t maxFrameBytes_;
};

} // namespace ChatCast
