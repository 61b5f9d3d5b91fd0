#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ChatCast {

/**
 * @brief Transfer description captured from the first accepted chunk.
 */
struct TransferMeta {
    uint32_t totalChunks{0};
    uint32_t chunkSizeHint{0};
    std::string filename;
    uint64_t totalSize{0};
};

/**
 * @brief Outcome of recording one sequence, computed under the transfer lock.
 */
struct ReceiptUpdate {
    bool inserted{false};          // false for a duplicate
    int64_t highestContiguous{-1};
    bool complete{false};
    bool justCompleted{false};     // this insertion completed the transfer
};

/**
 * @brief Copy of a transfer's progress for status reporting.
 */
struct TransferSnapshot {
    std::string transferId;
    TransferMeta meta;
    size_t receivedCount{0};
    int64_t highestContiguous{-1};
    bool complete{false};
    std::chrono::steady_clock::time_point lastTouched;
};

/**
 * @brief Receipt ledger of one transfer.
 *
 * received only grows. highestContiguous is the largest n with {0..n} all
 * received, or -1, and is advanced incrementally on each insertion. meta is
 * fixed at construction. All members are guarded by one mutex per transfer,
 * so unrelated transfers never contend.
 */
class TransferState {
public:
    using Clock = std::chrono::steady_clock;

    explicit TransferState(TransferMeta meta, Clock::time_point now = Clock::now());

    TransferState(const TransferState&) = delete;
    TransferState& operator=(const TransferState&) = delete;

    /**
     * @brief Record a sequence (idempotent) and advance the contiguous prefix.
     */
    ReceiptUpdate recordReceived(uint32_t sequence, Clock::time_point now = Clock::now());

    bool hasReceived(uint32_t sequence) const;

    /**
     * @brief Sequences in [0, totalChunks) not yet received, ascending.
     */
    std::vector<uint32_t> missing() const;

    int64_t highestContiguous() const;
    size_t receivedCount() const;
    std::set<uint32_t> received() const;
    bool isComplete() const;

    const TransferMeta& meta() const { return meta_; }

    void touch(Clock::time_point now = Clock::now());
    Clock::time_point lastTouched() const;

    TransferSnapshot snapshot(const std::string& transferId) const;

private:
    bool isCompleteLocked() const;

    const TransferMeta meta_;

    mutable std::mutex mutex_;
    std::set<uint32_t> received_;
    int64_t highestContiguous_{-1};
    Clock::time_point lastTouched_;
};

} // namespace ChatCast
