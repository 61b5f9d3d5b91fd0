#include "RelayServer.h"
#include "ErrorCodes.h"
#include "FrameCodec.h"
#include "LoggerMacros.h"
#include "RecordIO.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>

namespace ChatCast {

void RelayServer::Connection::send(const ControlFrame& reply) {
    auto& metrics = MetricsCollector::instance();
    std::string record = FrameCodec::encodeControl(reply);

    VoidResult written = Ok();
    {
        std::lock_guard<std::mutex> lock(writeMutex);
        written = RecordIO::writeRecord(socket.get(), record);
    }

    if (written.isError()) {
        metrics.incrementSendFailures();
        Logger::instance().warn("Dropped " + reply.commandName + " to " + peerId + ": " +
                                written.error().message, "RelayServer");
        return;
    }
    metrics.addBytesSent(record.size() + sizeof(uint32_t));
}

RelayServer::RelayServer(ReliabilityEngine& engine, Options options)
    : engine_(engine)
    , options_(std::move(options))
    , pool_(options_.workerThreads, "RelayWorkers")
{
}

RelayServer::~RelayServer() {
    stop();
}

bool RelayServer::start() {
    if (listening_) {
        return true;
    }
    logger_.info("Starting relay on " + options_.bindAddress + ":" + std::to_string(options_.port),
                 "RelayServer");

    SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        logger_.error("Failed to create server socket: " + std::string(strerror(errno)), "RelayServer");
        return false;
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        logger_.error("Failed to set socket options: " + std::string(strerror(errno)), "RelayServer");
        return false;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(options_.port));
    if (inet_pton(AF_INET, options_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        logger_.error("Invalid bind address: " + options_.bindAddress, "RelayServer");
        return false;
    }

    if (bind(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        logger_.error("Failed to bind to " + options_.bindAddress + ":" + std::to_string(options_.port) +
                      ": " + std::string(strerror(errno)), "RelayServer");
        return false;
    }

    if (listen(sock.get(), SOMAXCONN) < 0) {
        logger_.error("Failed to listen: " + std::string(strerror(errno)), "RelayServer");
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        logger_.error("Failed to read bound port: " + std::string(strerror(errno)), "RelayServer");
        return false;
    }

    serverSocket_ = std::move(sock);
    listeningPort_ = ntohs(addr.sin_port);
    listening_ = true;
    listenThread_ = std::thread(&RelayServer::listenLoop, this);

    logger_.info("Relay listening on " + options_.bindAddress + ":" + std::to_string(listeningPort_.load()) +
                 " (" + std::to_string(pool_.threadCount()) + " workers)", "RelayServer");
    return true;
}

void RelayServer::stop() {
    if (!listening_.exchange(false)) {
        return;
    }
    logger_.info("Stopping relay", "RelayServer");

    if (listenThread_.joinable()) {
        listenThread_.join();
    }
    serverSocket_.reset();
    listeningPort_ = 0;

    // Unblock readers; descriptors stay open until the last task lets go
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        count = connections_.size();
        for (auto& pair : connections_) {
            pair.second->socket.shutdownBoth();
        }
    }

    // Readers take threadMutex_ on exit, so join outside it
    std::map<uint64_t, std::thread> readers;
    {
        std::lock_guard<std::mutex> lock(threadMutex_);
        readers.swap(readThreads_);
    }
    for (auto& pair : readers) {
        if (pair.second.joinable()) {
            pair.second.join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(threadMutex_);
        finishedReaders_.clear();
    }

    pool_.shutdown();

    logger_.info("Relay stopped, closed " + std::to_string(count) + " connections", "RelayServer");
}

size_t RelayServer::connectionCount() const {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    return connections_.size();
}

std::vector<std::string> RelayServer::getConnectedPeers() const {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    std::vector<std::string> peers;
    peers.reserve(connections_.size());
    for (const auto& pair : connections_) {
        peers.push_back(pair.second->peerId);
    }
    return peers;
}

void RelayServer::reapFinishedReaders() {
    std::lock_guard<std::mutex> lock(threadMutex_);
    for (uint64_t id : finishedReaders_) {
        auto it = readThreads_.find(id);
        if (it != readThreads_.end()) {
            if (it->second.joinable()) {
                it->second.join();
            }
            readThreads_.erase(it);
        }
    }
    finishedReaders_.clear();
}

void RelayServer::listenLoop() {
    while (listening_) {
        reapFinishedReaders();

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(serverSocket_.get(), &readfds);

        struct timeval tv;
        tv.tv_sec = 1;
        tv.tv_usec = 0;

        int activity = select(serverSocket_.get() + 1, &readfds, nullptr, nullptr, &tv);
        if (activity <= 0) continue;

        struct sockaddr_in clientAddr;
        socklen_t len = sizeof(clientAddr);
        SocketGuard clientSocket(accept(serverSocket_.get(), reinterpret_cast<struct sockaddr*>(&clientAddr), &len));
        if (!clientSocket) {
            logger_.warn("accept failed: " + std::string(strerror(errno)), "RelayServer");
            continue;
        }

        char clientIpBuf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &(clientAddr.sin_addr), clientIpBuf, INET_ADDRSTRLEN);
        std::string peerId = std::string(clientIpBuf) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        auto connection = std::make_shared<Connection>(nextConnectionId_++, std::move(clientSocket), peerId);
        {
            std::lock_guard<std::mutex> lock(connectionMutex_);
            connections_[connection->id] = connection;
        }
        metrics_.incrementConnectionsOpened();
        logger_.info("New connection from " + peerId, "RelayServer");

        std::lock_guard<std::mutex> lock(threadMutex_);
        readThreads_[connection->id] = std::thread(&RelayServer::readLoop, this, connection);
    }
}

void RelayServer::readLoop(std::shared_ptr<Connection> connection) {
    LOG_DEBUG_COMP_IF("Starting read loop for " + connection->peerId, "RelayServer");

    while (true) {
        auto record = RecordIO::readRecord(connection->socket.get(), options_.maxFrameBytes);
        if (record.isError()) {
            const Error& err = record.error();
            if (err.code == static_cast<int>(Core::ErrorCode::FRAME_TOO_LARGE)) {
                logger_.warn("Closing " + connection->peerId + ": " + err.message, "RelayServer");
            } else if (err.code != static_cast<int>(Core::ErrorCode::CONNECTION_CLOSED) && listening_) {
                logger_.warn("Read from " + connection->peerId + " failed: " + err.message, "RelayServer");
            }
            break;
        }

        metrics_.addBytesReceived(record.value().size() + sizeof(uint32_t));

        std::string payload = std::move(record.value());
        bool queued = pool_.submit([this, connection, payload]() {
            handleRecord(connection, payload);
        });
        if (!queued) {
            logger_.warn("Dropping frame from " + connection->peerId + ": relay is shutting down", "RelayServer");
            break;
        }
    }

    connection->socket.shutdownBoth();
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        connections_.erase(connection->id);
    }
    metrics_.incrementConnectionsClosed();
    logger_.info("Connection closed from " + connection->peerId, "RelayServer");

    std::lock_guard<std::mutex> lock(threadMutex_);
    finishedReaders_.push_back(connection->id);
}

void RelayServer::handleRecord(const std::shared_ptr<Connection>& connection, const std::string& record) {
    auto decoded = FrameCodec::decode(record);
    if (decoded.isError()) {
        logger_.warn("Undecodable frame from " + connection->peerId + ": " + decoded.error().message,
                     "RelayServer");
        engine_.reportUndecodable(decoded.error().message, FrameCodec::peekSequence(record),
                                  connection->peerId, *connection);
        return;
    }

    engine_.dispatch(decoded.value(), connection->peerId, *connection);
}

} // namespace ChatCast
