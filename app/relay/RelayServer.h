#pragma once

#include "IReplySink.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "ReliabilityEngine.h"
#include "SocketGuard.h"
#include "ThreadPool.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ChatCast {

/**
 * @brief TCP front end of the reliability engine
 *
 * Manages:
 * - the listening socket and accept loop
 * - one reader thread per peer connection
 * - dispatch of decoded frames on a worker pool
 * - serialized replies back to the originating connection
 */
class RelayServer {
public:
    struct Options {
        std::string bindAddress{"0.0.0.0"};
        int port{5050};                     // 0 = pick an ephemeral port
        size_t maxFrameBytes{16 * 1024 * 1024};
        size_t workerThreads{0};            // 0 = hardware concurrency
    };

    RelayServer(ReliabilityEngine& engine, Options options);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /**
     * @brief Bind, listen and start accepting connections
     * @return true if the server is listening
     */
    bool start();

    /**
     * @brief Stop accepting, close all connections and drain pending frames
     */
    void stop();

    bool isRunning() const { return listening_; }

    /**
     * @brief Port actually bound, or 0 if not listening
     */
    int getListeningPort() const { return listeningPort_; }

    size_t connectionCount() const;
    std::vector<std::string> getConnectedPeers() const;

private:
    /**
     * @brief One accepted peer. Shared with queued frame tasks so replies
     * can still be attempted after the reader has gone.
     */
    struct Connection : public IReplySink {
        Connection(uint64_t connectionId, SocketGuard sock, std::string peer)
            : id(connectionId), socket(std::move(sock)), peerId(std::move(peer)) {}

        void send(const ControlFrame& reply) override;

        const uint64_t id;
        SocketGuard socket;
        const std::string peerId;
        std::mutex writeMutex;
    };

    void listenLoop();
    void readLoop(std::shared_ptr<Connection> connection);
    void handleRecord(const std::shared_ptr<Connection>& connection, const std::string& record);
    void reapFinishedReaders();

    ReliabilityEngine& engine_;
    Options options_;
    ThreadPool pool_;

    Logger& logger_{Logger::instance()};
    MetricsCollector& metrics_{MetricsCollector::instance()};

    SocketGuard serverSocket_;
    std::atomic<int> listeningPort_{0};
    std::atomic<bool> listening_{false};
    std::thread listenThread_;
    uint64_t nextConnectionId_{1};

    mutable std::mutex connectionMutex_;
    std::map<uint64_t, std::shared_ptr<Connection>> connections_;

    std::mutex threadMutex_;
    std::map<uint64_t, std::thread> readThreads_;
    std::vector<uint64_t> finishedReaders_;
};

} // namespace ChatCast
