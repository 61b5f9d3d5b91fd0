#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace ChatCast {

    // Snapshot structs for returning metrics (non-atomic)
    struct FrameMetricsSnapshot {
        uint64_t messagesReceived{0};
        uint64_t chunksReceived{0};
        uint64_t controlsReceived{0};
        uint64_t undecodableFrames{0};
        uint64_t duplicateChunks{0};
    };

    struct ReplyMetricsSnapshot {
        uint64_t acksSent{0};
        uint64_t cumulativeAcksSent{0};
        uint64_t nacksSent{0};
        uint64_t missingReportsSent{0};
        uint64_t integrityFailures{0};
        uint64_t internalErrors{0};
    };

    struct TransferMetricsSnapshot {
        uint64_t transfersStarted{0};
        uint64_t transfersCompleted{0};
        uint64_t transfersEvicted{0};
        uint64_t resumeRequests{0};
    };

    struct NetworkMetricsSnapshot {
        uint64_t bytesReceived{0};
        uint64_t bytesSent{0};
        uint64_t connectionsOpened{0};
        uint64_t connectionsClosed{0};
        uint64_t sendFailures{0};
    };

    // Internal structs with atomics
    struct FrameMetrics {
        std::atomic<uint64_t> messagesReceived{0};
        std::atomic<uint64_t> chunksReceived{0};
        std::atomic<uint64_t> controlsReceived{0};
        std::atomic<uint64_t> undecodableFrames{0};
        std::atomic<uint64_t> duplicateChunks{0};
    };

    struct ReplyMetrics {
        std::atomic<uint64_t> acksSent{0};
        std::atomic<uint64_t> cumulativeAcksSent{0};
        std::atomic<uint64_t> nacksSent{0};
        std::atomic<uint64_t> missingReportsSent{0};
        std::atomic<uint64_t> integrityFailures{0};
        std::atomic<uint64_t> internalErrors{0};
    };

    struct TransferMetrics {
        std::atomic<uint64_t> transfersStarted{0};
        std::atomic<uint64_t> transfersCompleted{0};
        std::atomic<uint64_t> transfersEvicted{0};
        std::atomic<uint64_t> resumeRequests{0};
    };

    struct NetworkMetrics {
        std::atomic<uint64_t> bytesReceived{0};
        std::atomic<uint64_t> bytesSent{0};
        std::atomic<uint64_t> connectionsOpened{0};
        std::atomic<uint64_t> connectionsClosed{0};
        std::atomic<uint64_t> sendFailures{0};
    };

    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Inbound frames
        void incrementMessagesReceived();
        void incrementChunksReceived();
        void incrementControlsReceived();
        void incrementUndecodableFrames();
        void incrementDuplicateChunks();

        // Replies
        void incrementAcksSent();
        void incrementCumulativeAcksSent();
        void incrementNacksSent();
        void incrementMissingReportsSent();
        void incrementIntegrityFailures();
        void incrementInternalErrors();

        // Transfers
        void incrementTransfersStarted();
        void incrementTransfersCompleted();
        void addTransfersEvicted(uint64_t count);
        void incrementResumeRequests();

        // Network
        void addBytesReceived(uint64_t bytes);
        void addBytesSent(uint64_t bytes);
        void incrementConnectionsOpened();
        void incrementConnectionsClosed();
        void incrementSendFailures();

        FrameMetricsSnapshot getFrameMetrics() const;
        ReplyMetricsSnapshot getReplyMetrics() const;
        TransferMetricsSnapshot getTransferMetrics() const;
        NetworkMetricsSnapshot getNetworkMetrics() const;

        // Get formatted metrics string
        std::string getMetricsSummary() const;

        // Prometheus-compatible export
        std::string exportPrometheus() const;

        void reset();

        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        FrameMetrics frameMetrics_;
        ReplyMetrics replyMetrics_;
        TransferMetrics transferMetrics_;
        NetworkMetrics networkMetrics_;

        std::chrono::steady_clock::time_point startTime_;
    };

} // namespace ChatCast
