#include "TransferState.h"

#include <algorithm>
#include <cstdint>

namespace ChatCast {

TransferState::TransferState(TransferMeta meta, Clock::time_point now)
    : meta_(std::move(meta)), lastTouched_(now) {
}

ReceiptUpdate TransferState::recordReceived(uint32_t sequence, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastTouched_ = now;

    ReceiptUpdate update;
    bool wasComplete = isCompleteLocked();

    update.inserted = received_.insert(sequence).second;
    if (update.inserted) {
        // Advance from the current boundary only; never rescan the prefix.
        auto next = received_.find(static_cast<uint32_t>(highestContiguous_ + 1));
        while (next != received_.end() &&
               static_cast<int64_t>(*next) == highestContiguous_ + 1) {
            ++highestContiguous_;
            ++next;
        }
    }

    update.highestContiguous = highestContiguous_;
    update.complete = isCompleteLocked();
    update.justCompleted = update.complete && !wasComplete;
    return update;
}

bool TransferState::hasReceived(uint32_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_.count(sequence) > 0;
}

std::vector<uint32_t> TransferState::missing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> gaps;

    // Everything up to highestContiguous is present.
    uint64_t candidate = static_cast<uint64_t>(highestContiguous_ + 1);
    auto it = received_.lower_bound(static_cast<uint32_t>(
        std::min<uint64_t>(candidate, UINT32_MAX)));

    for (; candidate < meta_.totalChunks; ++candidate) {
        while (it != received_.end() && *it < candidate) {
            ++it;
        }
        if (it != received_.end() && *it == candidate) {
            ++it;
            continue;
        }
        gaps.push_back(static_cast<uint32_t>(candidate));
    }
    return gaps;
}

int64_t TransferState::highestContiguous() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return highestContiguous_;
}

size_t TransferState::receivedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_.size();
}

std::set<uint32_t> TransferState::received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
}

bool TransferState::isComplete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isCompleteLocked();
}

bool TransferState::isCompleteLocked() const {
    return meta_.totalChunks > 0 &&
           highestContiguous_ == static_cast<int64_t>(meta_.totalChunks) - 1;
}

void TransferState::touch(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastTouched_ = now;
}

TransferState::Clock::time_point TransferState::lastTouched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastTouched_;
}

TransferSnapshot TransferState::snapshot(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    TransferSnapshot snap;
    snap.transferId = transferId;
    snap.meta = meta_;
    snap.receivedCount = received_.size();
    snap.highestContiguous = highestContiguous_;
    snap.complete = isCompleteLocked();
    snap.lastTouched = lastTouched_;
    return snap;
}

} // namespace ChatCast
