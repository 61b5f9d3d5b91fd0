#include "MetricsCollector.h"
#include <sstream>

namespace ChatCast {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::steady_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    // Inbound frames
    void MetricsCollector::incrementMessagesReceived() { frameMetrics_.messagesReceived++; }
    void MetricsCollector::incrementChunksReceived() { frameMetrics_.chunksReceived++; }
    void MetricsCollector::incrementControlsReceived() { frameMetrics_.controlsReceived++; }
    void MetricsCollector::incrementUndecodableFrames() { frameMetrics_.undecodableFrames++; }
    void MetricsCollector::incrementDuplicateChunks() { frameMetrics_.duplicateChunks++; }

    // Replies
    void MetricsCollector::incrementAcksSent() { replyMetrics_.acksSent++; }
    void MetricsCollector::incrementCumulativeAcksSent() { replyMetrics_.cumulativeAcksSent++; }
    void MetricsCollector::incrementNacksSent() { replyMetrics_.nacksSent++; }
    void MetricsCollector::incrementMissingReportsSent() { replyMetrics_.missingReportsSent++; }
    void MetricsCollector::incrementIntegrityFailures() { replyMetrics_.integrityFailures++; }
    void MetricsCollector::incrementInternalErrors() { replyMetrics_.internalErrors++; }

    // Transfers
    void MetricsCollector::incrementTransfersStarted() { transferMetrics_.transfersStarted++; }
    void MetricsCollector::incrementTransfersCompleted() { transferMetrics_.transfersCompleted++; }
    void MetricsCollector::addTransfersEvicted(uint64_t count) { transferMetrics_.transfersEvicted += count; }
    void MetricsCollector::incrementResumeRequests() { transferMetrics_.resumeRequests++; }

    // Network
    void MetricsCollector::addBytesReceived(uint64_t bytes) { networkMetrics_.bytesReceived += bytes; }
    void MetricsCollector::addBytesSent(uint64_t bytes) { networkMetrics_.bytesSent += bytes; }
    void MetricsCollector::incrementConnectionsOpened() { networkMetrics_.connectionsOpened++; }
    void MetricsCollector::incrementConnectionsClosed() { networkMetrics_.connectionsClosed++; }
    void MetricsCollector::incrementSendFailures() { networkMetrics_.sendFailures++; }

    FrameMetricsSnapshot MetricsCollector::getFrameMetrics() const {
        FrameMetricsSnapshot snapshot;
        snapshot.messagesReceived = frameMetrics_.messagesReceived.load();
        snapshot.chunksReceived = frameMetrics_.chunksReceived.load();
        snapshot.controlsReceived = frameMetrics_.controlsReceived.load();
        snapshot.undecodableFrames = frameMetrics_.undecodableFrames.load();
        snapshot.duplicateChunks = frameMetrics_.duplicateChunks.load();
        return snapshot;
    }

    ReplyMetricsSnapshot MetricsCollector::getReplyMetrics() const {
        ReplyMetricsSnapshot snapshot;
        snapshot.acksSent = replyMetrics_.acksSent.load();
        snapshot.cumulativeAcksSent = replyMetrics_.cumulativeAcksSent.load();
        snapshot.nacksSent = replyMetrics_.nacksSent.load();
        snapshot.missingReportsSent = replyMetrics_.missingReportsSent.load();
        snapshot.integrityFailures = replyMetrics_.integrityFailures.load();
        snapshot.internalErrors = replyMetrics_.internalErrors.load();
        return snapshot;
    }

    TransferMetricsSnapshot MetricsCollector::getTransferMetrics() const {
        TransferMetricsSnapshot snapshot;
        snapshot.transfersStarted = transferMetrics_.transfersStarted.load();
        snapshot.transfersCompleted = transferMetrics_.transfersCompleted.load();
        snapshot.transfersEvicted = transferMetrics_.transfersEvicted.load();
        snapshot.resumeRequests = transferMetrics_.resumeRequests.load();
        return snapshot;
    }

    NetworkMetricsSnapshot MetricsCollector::getNetworkMetrics() const {
        NetworkMetricsSnapshot snapshot;
        snapshot.bytesReceived = networkMetrics_.bytesReceived.load();
        snapshot.bytesSent = networkMetrics_.bytesSent.load();
        snapshot.connectionsOpened = networkMetrics_.connectionsOpened.load();
        snapshot.connectionsClosed = networkMetrics_.connectionsClosed.load();
        snapshot.sendFailures = networkMetrics_.sendFailures.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        auto frames = getFrameMetrics();
        auto replies = getReplyMetrics();
        auto transfers = getTransferMetrics();
        auto network = getNetworkMetrics();

        std::stringstream ss;
        ss << "=== ChatCast Relay Metrics ===\n";
        ss << "Uptime: " << getUptime().count() << "s\n\n";

        ss << "Frames:\n";
        ss << "  Messages: " << frames.messagesReceived << "\n";
        ss << "  File chunks: " << frames.chunksReceived << "\n";
        ss << "  Controls: " << frames.controlsReceived << "\n";
        ss << "  Undecodable: " << frames.undecodableFrames << "\n";
        ss << "  Duplicate chunks: " << frames.duplicateChunks << "\n\n";

        ss << "Replies:\n";
        ss << "  ACK: " << replies.acksSent << "\n";
        ss << "  CUM_ACK: " << replies.cumulativeAcksSent << "\n";
        ss << "  NACK: " << replies.nacksSent << "\n";
        ss << "  MISSING: " << replies.missingReportsSent << "\n";
        ss << "  INTEGRITY_FAIL: " << replies.integrityFailures << "\n";
        ss << "  Internal errors: " << replies.internalErrors << "\n\n";

        ss << "Transfers:\n";
        ss << "  Started: " << transfers.transfersStarted << "\n";
        ss << "  Completed: " << transfers.transfersCompleted << "\n";
        ss << "  Evicted: " << transfers.transfersEvicted << "\n";
        ss << "  Resume requests: " << transfers.resumeRequests << "\n\n";

        ss << "Network:\n";
        ss << "  Received: " << (network.bytesReceived / 1024) << " KB\n";
        ss << "  Sent: " << (network.bytesSent / 1024) << " KB\n";
        ss << "  Connections opened: " << network.connectionsOpened << "\n";
        ss << "  Connections closed: " << network.connectionsClosed << "\n";
        ss << "  Send failures: " << network.sendFailures << "\n";

        return ss.str();
    }

    std::string MetricsCollector::exportPrometheus() const {
        auto frames = getFrameMetrics();
        auto replies = getReplyMetrics();
        auto transfers = getTransferMetrics();
        auto network = getNetworkMetrics();

        std::stringstream ss;

        auto counter = [&ss](const char* name, const char* help, uint64_t value) {
            ss << "# HELP " << name << " " << help << "\n";
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << value << "\n";
        };

        counter("chatcast_messages_received_total", "Message frames received", frames.messagesReceived);
        counter("chatcast_chunks_received_total", "File chunk frames received", frames.chunksReceived);
        counter("chatcast_controls_received_total", "Control frames received", frames.controlsReceived);
        counter("chatcast_undecodable_frames_total", "Frames rejected before dispatch", frames.undecodableFrames);
        counter("chatcast_duplicate_chunks_total", "Chunks received more than once", frames.duplicateChunks);

        counter("chatcast_acks_sent_total", "ACK controls sent", replies.acksSent);
        counter("chatcast_cum_acks_sent_total", "CUM_ACK controls sent", replies.cumulativeAcksSent);
        counter("chatcast_nacks_sent_total", "NACK controls sent", replies.nacksSent);
        counter("chatcast_missing_reports_sent_total", "MISSING controls sent", replies.missingReportsSent);
        counter("chatcast_integrity_failures_total", "INTEGRITY_FAIL controls sent", replies.integrityFailures);
        counter("chatcast_internal_errors_total", "Frames failed with internal_error", replies.internalErrors);

        counter("chatcast_transfers_started_total", "Transfers created in the registry", transfers.transfersStarted);
        counter("chatcast_transfers_completed_total", "Transfers that reached completion", transfers.transfersCompleted);
        counter("chatcast_transfers_evicted_total", "Transfers evicted after idling", transfers.transfersEvicted);
        counter("chatcast_resume_requests_total", "RESUME_REQUEST controls handled", transfers.resumeRequests);

        counter("chatcast_bytes_received_total", "Bytes read from peers", network.bytesReceived);
        counter("chatcast_bytes_sent_total", "Bytes written to peers", network.bytesSent);
        counter("chatcast_connections_opened_total", "Accepted connections", network.connectionsOpened);
        counter("chatcast_connections_closed_total", "Closed connections", network.connectionsClosed);
        counter("chatcast_send_failures_total", "Replies that could not be written", network.sendFailures);

        ss << "# HELP chatcast_uptime_seconds Relay uptime in seconds\n";
        ss << "# TYPE chatcast_uptime_seconds gauge\n";
        ss << "chatcast_uptime_seconds " << getUptime().count() << "\n";

        return ss.str();
    }

    void MetricsCollector::reset() {
        frameMetrics_.messagesReceived = 0;
        frameMetrics_.chunksReceived = 0;
        frameMetrics_.controlsReceived = 0;
        frameMetrics_.undecodableFrames = 0;
        frameMetrics_.duplicateChunks = 0;

        replyMetrics_.acksSent = 0;
        replyMetrics_.cumulativeAcksSent = 0;
        replyMetrics_.nacksSent = 0;
        replyMetrics_.missingReportsSent = 0;
        replyMetrics_.integrityFailures = 0;
        replyMetrics_.internalErrors = 0;

        transferMetrics_.transfersStarted = 0;
        transferMetrics_.transfersCompleted = 0;
        transferMetrics_.transfersEvicted = 0;
        transferMetrics_.resumeRequests = 0;

        networkMetrics_.bytesReceived = 0;
        networkMetrics_.bytesSent = 0;
        networkMetrics_.connectionsOpened = 0;
        networkMetrics_.connectionsClosed = 0;
        networkMetrics_.sendFailures = 0;
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_);
    }

} // namespace ChatCast
