#include "RelayDaemon.h"
#include "Logger.h"
#include "MetricsCollector.h"

#include <chrono>
#include <csignal>
#include <iostream>

namespace ChatCast {

namespace {
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }
}

RelayDaemon::RelayDaemon(RelayConfig config)
    : config_(std::move(config))
{
}

RelayDaemon::~RelayDaemon() {
    shutdown();
}

bool RelayDaemon::initialize() {
    auto& logger = Logger::instance();
    logger.info("ChatCast relay initializing...", "Daemon");

    auto codec = makeIntegrityCodec(config_.integrityMode, config_.integrityKey);
    if (codec.isError()) {
        logger.error(codec.error().toString(), "Daemon");
        return false;
    }
    codec_ = std::move(codec.value());

    registry_ = std::make_unique<TransferRegistry>(config_.shardCount);

    ReliabilityEngine::Options engineOptions;
    engineOptions.cumAckInterval = config_.cumAckInterval;
    engine_ = std::make_unique<ReliabilityEngine>(*registry_, *codec_, engineOptions);

    RelayServer::Options serverOptions;
    serverOptions.bindAddress = config_.bindAddress;
    serverOptions.port = config_.port;
    serverOptions.maxFrameBytes = config_.maxFrameBytes;
    serverOptions.workerThreads = config_.workerThreads;
    server_ = std::make_unique<RelayServer>(*engine_, serverOptions);

    if (!server_->start()) {
        logger.error("Relay server failed to start", "Daemon");
        return false;
    }

    registry_->startSweeper(std::chrono::seconds(config_.sweepIntervalSeconds),
                            std::chrono::seconds(config_.idleTtlSeconds));

    running_ = true;
    logger.info("Relay initialization complete", "Daemon");
    return true;
}

void RelayDaemon::run() {
    auto& logger = Logger::instance();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    logger.info("Relay running. Press Ctrl+C to stop.", "Daemon");

    auto reportInterval = std::chrono::seconds(config_.metricsReportIntervalSeconds);
    auto nextReport = std::chrono::steady_clock::now() + reportInterval;

    {
        std::unique_lock<std::mutex> lock(runMutex_);
        while (running_ && !stopRequested_ && !signalReceived) {
            runCv_.wait_for(lock, std::chrono::seconds(1));

            if (reportInterval.count() > 0 && std::chrono::steady_clock::now() >= nextReport) {
                logStatus();
                nextReport += reportInterval;
            }
        }
    }

    if (signalReceived) {
        int sigNum = receivedSignalNum;
        logger.info("Received signal " + std::to_string(sigNum) + ", initiating shutdown", "Daemon");
    }

    shutdown();
}

void RelayDaemon::requestStop() {
    {
        std::lock_guard<std::mutex> lock(runMutex_);
        stopRequested_ = true;
    }
    runCv_.notify_all();
}

void RelayDaemon::shutdown() {
    if (!running_.exchange(false)) return;

    auto& logger = Logger::instance();
    logger.info("Shutting down relay...", "Daemon");

    // Reverse order of initialization
    if (registry_) {
        registry_->stopSweeper();
    }
    if (server_) {
        server_->stop();
    }

    logStatus();
    logger.info("Relay stopped gracefully", "Daemon");
    std::cout << "Relay stopped." << std::endl;
}

void RelayDaemon::logStatus() {
    auto& logger = Logger::instance();
    size_t active = 0;
    size_t complete = 0;
    if (registry_) {
        for (const auto& snap : registry_->snapshot()) {
            if (snap.complete) {
                ++complete;
            } else {
                ++active;
            }
        }
    }
    logger.info("Transfers: " + std::to_string(active) + " in progress, " + std::to_string(complete) +
                " complete; connections: " + std::to_string(server_ ? server_->connectionCount() : 0),
                "Daemon");
    logger.info(MetricsCollector::instance().getMetricsSummary(), "Daemon");
}

} // namespace ChatCast
