#pragma once

#include "Config.h"
#include "Logger.h"
#include "Result.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace ChatCast {

/**
 * @brief Typed view of the relay's configuration keys.
 *
 * Defaults match a relay started with no configuration file.
 */
struct RelayConfig {
    // relay.*
    std::string bindAddress{"0.0.0.0"};
    int port{5050};
    size_t maxFrameBytes{16 * 1024 * 1024};
    size_t workerThreads{0};

    // reliability.*
    uint32_t cumAckInterval{4};
    std::string integrityMode{"crc32"};
    std::string integrityKey;

    // registry.*
    size_t shardCount{16};
    uint32_t idleTtlSeconds{1800};
    uint32_t sweepIntervalSeconds{60};

    // log.*
    std::string logFile;
    LogLevel logLevel{LogLevel::INFO};
    size_t logMaxFileMb{100};
    size_t logMaxFiles{5};

    // metrics.*
    uint32_t metricsReportIntervalSeconds{60};

    /**
     * @brief Build from a Config store; keys that are absent keep their defaults.
     *
     * Fails with INVALID_CONFIGURATION naming the first bad key.
     */
    static Result<RelayConfig> fromConfig(const Config& config);

    /**
     * @brief Range checks that also apply after command-line overrides.
     */
    VoidResult validate() const;
};

} // namespace ChatCast
