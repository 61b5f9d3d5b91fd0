#include "RelayConfig.h"
#include "ErrorCodes.h"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <unordered_map>

namespace ChatCast {

namespace {

    const char* COMPONENT = "RelayConfig";

    bool isUnsigned(const std::string& value) {
        return !value.empty() && value.size() <= 19 &&
               std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
    }

    std::string lowered(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    bool isIPv4(const std::string& value) {
        in_addr addr{};
        return ::inet_pton(AF_INET, value.c_str(), &addr) == 1;
    }

    Error invalid(const std::string& key, const std::string& detail) {
        return Core::makeError(Core::ErrorCode::INVALID_CONFIGURATION,
                               "Invalid value for " + key + ": " + detail, COMPONENT);
    }

}

Result<RelayConfig> RelayConfig::fromConfig(const Config& config) {
    auto number = [](const std::string&, const std::string& value) { return isUnsigned(value); };

    const std::unordered_map<std::string, Config::Validator> schema = {
        {"relay.bind_address", [](const std::string&, const std::string& v) { return isIPv4(v); }},
        {"relay.port", number},
        {"relay.max_frame_bytes", number},
        {"relay.worker_threads", number},
        {"reliability.cum_ack_interval", number},
        {"reliability.integrity_mode", [](const std::string&, const std::string& v) {
            std::string mode = lowered(v);
            return mode == "crc32" || mode == "hmac-sha256";
        }},
        {"registry.shard_count", number},
        {"registry.idle_ttl_seconds", number},
        {"registry.sweep_interval_seconds", number},
        {"log.level", [](const std::string&, const std::string& v) {
            std::string level = lowered(v);
            return level == "debug" || level == "info" || level == "warn" || level == "warning" ||
                   level == "error" || level == "critical";
        }},
        {"log.max_file_mb", number},
        {"log.max_files", number},
        {"metrics.report_interval_seconds", number},
    };

    for (const auto& key : config.keys()) {
        if (schema.count(key) == 0 && key != "reliability.integrity_key" && key != "log.file") {
            Logger::instance().warn("Ignoring unknown configuration key " + key, COMPONENT);
        }
    }

    std::string failedKey;
    if (!config.validate(schema, &failedKey)) {
        return invalid(failedKey, "'" + config.get(failedKey) + "'");
    }

    RelayConfig rc;
    rc.bindAddress = config.get("relay.bind_address", rc.bindAddress);
    size_t port = config.getSize("relay.port", static_cast<size_t>(rc.port));
    if (port > 65535) {
        return invalid("relay.port", std::to_string(port) + " is out of range");
    }
    rc.port = static_cast<int>(port);
    rc.maxFrameBytes = config.getSize("relay.max_frame_bytes", rc.maxFrameBytes);
    rc.workerThreads = config.getSize("relay.worker_threads", rc.workerThreads);

    rc.cumAckInterval = static_cast<uint32_t>(
        config.getSize("reliability.cum_ack_interval", rc.cumAckInterval));
    rc.integrityMode = lowered(config.get("reliability.integrity_mode", rc.integrityMode));
    rc.integrityKey = config.get("reliability.integrity_key", rc.integrityKey);

    rc.shardCount = config.getSize("registry.shard_count", rc.shardCount);
    rc.idleTtlSeconds = static_cast<uint32_t>(
        config.getSize("registry.idle_ttl_seconds", rc.idleTtlSeconds));
    rc.sweepIntervalSeconds = static_cast<uint32_t>(
        config.getSize("registry.sweep_interval_seconds", rc.sweepIntervalSeconds));

    rc.logFile = config.get("log.file", rc.logFile);
    if (config.hasKey("log.level")) {
        rc.logLevel = parseLogLevel(config.get("log.level"));
    }
    rc.logMaxFileMb = config.getSize("log.max_file_mb", rc.logMaxFileMb);
    rc.logMaxFiles = config.getSize("log.max_files", rc.logMaxFiles);

    rc.metricsReportIntervalSeconds = static_cast<uint32_t>(
        config.getSize("metrics.report_interval_seconds", rc.metricsReportIntervalSeconds));

    auto checked = rc.validate();
    if (checked.isError()) {
        return checked.error();
    }
    return rc;
}

VoidResult RelayConfig::validate() const {
    if (!isIPv4(bindAddress)) {
        return invalid("relay.bind_address", "'" + bindAddress + "' is not an IPv4 address");
    }
    if (port < 0 || port > 65535) {
        return invalid("relay.port", std::to_string(port) + " is out of range");
    }
    if (maxFrameBytes == 0 || maxFrameBytes > UINT32_MAX) {
        return invalid("relay.max_frame_bytes", "must be between 1 and " + std::to_string(UINT32_MAX));
    }
    if (cumAckInterval == 0) {
        return invalid("reliability.cum_ack_interval", "must be at least 1");
    }
    if (integrityMode != "crc32" && integrityMode != "hmac-sha256") {
        return invalid("reliability.integrity_mode", "'" + integrityMode + "'");
    }
    if (integrityMode == "hmac-sha256" && integrityKey.empty()) {
        return invalid("reliability.integrity_key", "required when integrity_mode is hmac-sha256");
    }
    if (shardCount == 0) {
        return invalid("registry.shard_count", "must be at least 1");
    }
    if (logMaxFileMb == 0) {
        return invalid("log.max_file_mb", "must be at least 1");
    }
    return Ok();
}

} // namespace ChatCast
