#pragma once

#include "TransferState.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ChatCast {

/**
 * @brief Process-wide store of transfer id -> TransferState.
 *
 * The map is split into shards, each with its own mutex held only for
 * lookup/insert. Protocol work happens on the TransferState under that
 * transfer's own lock, so transfers never serialize on each other.
 *
 * Entries are never removed except by idle eviction (evictIdle / the
 * sweeper thread); an evicted transfer is treated as abandoned.
 */
class TransferRegistry {
public:
    using Clock = TransferState::Clock;
    using StatePtr = std::shared_ptr<TransferState>;

    static constexpr size_t DEFAULT_SHARD_COUNT = 16;

    explicit TransferRegistry(size_t shardCount = DEFAULT_SHARD_COUNT);
    ~TransferRegistry();

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    /**
     * @brief Return the state for transferId, creating it with meta if absent.
     *
     * Creation happens at most once per id; for an existing id meta is
     * ignored. second is true when this call created the entry.
     */
    std::pair<StatePtr, bool> getOrCreate(const std::string& transferId, const TransferMeta& meta);

    /**
     * @brief Look up a transfer; nullptr if unknown (or evicted).
     */
    StatePtr get(const std::string& transferId) const;

    bool contains(const std::string& transferId) const;
    size_t size() const;
    size_t shardCount() const { return shards_.size(); }

    /**
     * @brief Remove transfers whose last touch is older than ttl.
     * @return Number of evicted transfers
     */
    size_t evictIdle(std::chrono::seconds ttl, Clock::time_point now = Clock::now());

    std::vector<TransferSnapshot> snapshot() const;

    /**
     * @brief Start the background idle sweep. No-op if ttl is zero.
     */
    void startSweeper(std::chrono::seconds interval, std::chrono::seconds ttl);
    void stopSweeper();
    bool isSweeperRunning() const { return sweeperRunning_.load(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, StatePtr> transfers;
    };

    Shard& shardFor(const std::string& transferId);
    const Shard& shardFor(const std::string& transferId) const;

    std::vector<std::unique_ptr<Shard>> shards_;

    std::thread sweeperThread_;
    std::atomic<bool> sweeperRunning_{false};
    std::mutex sweeperMutex_;
    std::condition_variable sweeperCv_;
};

} // namespace ChatCast
