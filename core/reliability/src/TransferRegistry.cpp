#include "TransferRegistry.h"
#include "Logger.h"
#include "MetricsCollector.h"

#include <functional>

namespace ChatCast {

TransferRegistry::TransferRegistry(size_t shardCount) {
    if (shardCount == 0) {
        shardCount = DEFAULT_SHARD_COUNT;
    }
    shards_.reserve(shardCount);
    for (size_t i = 0; i < shardCount; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

TransferRegistry::~TransferRegistry() {
    stopSweeper();
}

TransferRegistry::Shard& TransferRegistry::shardFor(const std::string& transferId) {
    return *shards_[std::hash<std::string>{}(transferId) % shards_.size()];
}

const TransferRegistry::Shard& TransferRegistry::shardFor(const std::string& transferId) const {
    return *shards_[std::hash<std::string>{}(transferId) % shards_.size()];
}

std::pair<TransferRegistry::StatePtr, bool> TransferRegistry::getOrCreate(const std::string& transferId,
                                                                        const TransferMeta& meta) {
    Shard& shard = shardFor(transferId);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.transfers.find(transferId);
    if (it != shard.transfers.end()) {
        return {it->second, false};
    }

    auto state = std::make_shared<TransferState>(meta);
    shard.transfers.emplace(transferId, state);
    return {state, true};
}

TransferRegistry::StatePtr TransferRegistry::get(const std::string& transferId) const {
    const Shard& shard = shardFor(transferId);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.transfers.find(transferId);
    return it == shard.transfers.end() ? nullptr : it->second;
}

bool TransferRegistry::contains(const std::string& transferId) const {
    return get(transferId) != nullptr;
}

size_t TransferRegistry::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->transfers.size();
    }
    return total;
}

size_t TransferRegistry::evictIdle(std::chrono::seconds ttl, Clock::time_point now) {
    auto& logger = Logger::instance();
    size_t evicted = 0;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->transfers.begin(); it != shard->transfers.end();) {
            auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - it->second->lastTouched());
            if (idle > ttl) {
                logger.warn("Evicting idle transfer " + it->first + " (idle for " +
                            std::to_string(idle.count()) + "s, " +
                            std::to_string(it->second->receivedCount()) + "/" +
                            std::to_string(it->second->meta().totalChunks) + " chunks)",
                            "TransferRegistry");
                it = shard->transfers.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }

    if (evicted > 0) {
        MetricsCollector::instance().addTransfersEvicted(evicted);
        logger.info("Evicted " + std::to_string(evicted) + " idle transfers", "TransferRegistry");
    }
    return evicted;
}

std::vector<TransferSnapshot> TransferRegistry::snapshot() const {
    std::vector<TransferSnapshot> out;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [id, state] : shard->transfers) {
            out.push_back(state->snapshot(id));
        }
    }
    return out;
}

void TransferRegistry::startSweeper(std::chrono::seconds interval, std::chrono::seconds ttl) {
    if (ttl.count() <= 0) {
        Logger::instance().info("Idle transfer eviction disabled", "TransferRegistry");
        return;
    }
    if (sweeperRunning_.exchange(true)) {
        return;
    }
    if (interval.count() <= 0) {
        interval = std::chrono::seconds(1);
    }

    sweeperThread_ = std::thread([this, interval, ttl]() {
        auto& logger = Logger::instance();
        logger.debug("Idle transfer sweeper started (ttl " + std::to_string(ttl.count()) + "s)",
                     "TransferRegistry");

        std::unique_lock<std::mutex> lock(sweeperMutex_);
        while (sweeperRunning_) {
            // Wakes early on stopSweeper()
            sweeperCv_.wait_for(lock, interval, [this]() { return !sweeperRunning_.load(); });
            if (!sweeperRunning_) {
                break;
            }
            lock.unlock();
            evictIdle(ttl);
            lock.lock();
        }

        logger.debug("Idle transfer sweeper stopped", "TransferRegistry");
    });
}

void TransferRegistry::stopSweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeperMutex_);
        sweeperRunning_ = false;
    }
    sweeperCv_.notify_all();
    if (sweeperThread_.joinable()) {
        sweeperThread_.join();
    }
}

} // namespace ChatCast
