#pragma once

#include "IntegrityCodec.h"
#include "RelayConfig.h"
#include "RelayServer.h"
#include "ReliabilityEngine.h"
#include "TransferRegistry.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace ChatCast {

/**
 * @brief Relay process orchestrator
 *
 * Owns the integrity codec, transfer registry, reliability engine and TCP
 * server, and runs the main loop until a signal or requestStop().
 */
class RelayDaemon {
public:
    explicit RelayDaemon(RelayConfig config);
    ~RelayDaemon();

    /**
     * @brief Build all components and start listening
     * @return true if successful
     */
    bool initialize();

    /**
     * @brief Block until SIGINT/SIGTERM or requestStop(), logging metrics
     * periodically, then shut down
     */
    void run();

    void requestStop();
    void shutdown();

    bool isRunning() const { return running_; }
    int getListeningPort() const { return server_ ? server_->getListeningPort() : 0; }
    const RelayConfig& getConfig() const { return config_; }

private:
    void logStatus();

    RelayConfig config_;

    std::unique_ptr<IIntegrityCodec> codec_;
    std::unique_ptr<TransferRegistry> registry_;
    std::unique_ptr<ReliabilityEngine> engine_;
    std::unique_ptr<RelayServer> server_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::mutex runMutex_;
    std::condition_variable runCv_;
};

} // namespace ChatCast
