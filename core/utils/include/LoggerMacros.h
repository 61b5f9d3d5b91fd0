/**
 * @file LoggerMacros.h
 * @brief Conditional logging macros for hot paths
 *
 * Per-frame logging in the reliability engine goes through these so the
 * message string is only built when the level is enabled.
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("ACK seq=" + std::to_string(seq), "ReliabilityEngine");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

namespace ChatCast {

#define LOG_DEBUG_IF(msg) \
    do { \
        auto& logger__ = ::ChatCast::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg); \
        } \
    } while(0)

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::ChatCast::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::ChatCast::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::ChatCast::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::ChatCast::Logger::instance().error(msg, component)

// Scoped performance timer (logs elapsed time on destruction)
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto end = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
            logger.debug(name_ + " took " + std::to_string(duration) + "us", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::ChatCast::ScopedTimer timer__(name, component)

} // namespace ChatCast
