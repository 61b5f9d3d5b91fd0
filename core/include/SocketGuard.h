#pragma once

/**
 * @file SocketGuard.h
 * @brief Owning handle for a socket descriptor
 */

#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace ChatCast {

/**
 * @brief Closes the owned socket on destruction.
 *
 * @code
 * SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
 * if (!sock) { ... }
 * ::connect(sock.get(), ...);
 * @endcode
 */
class SocketGuard {
public:
    SocketGuard() noexcept = default;
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.release()) {}

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    ~SocketGuard() { reset(); }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /// Wake up any thread blocked on the socket without releasing the descriptor.
    void shutdownBoth() const noexcept {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

private:
    int fd_{-1};
};

} // namespace ChatCast
