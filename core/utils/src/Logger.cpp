#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>

namespace ChatCast {

    namespace {

        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            auto seconds = std::chrono::system_clock::to_time_t(now);
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;

            struct tm tm_buf;
            localtime_r(&seconds, &tm_buf);

            char buf[32];
            size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
            std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(millis));
            return buf;
        }

        std::string formatEntry(LogLevel level, const std::string& component, const std::string& message) {
            return "[" + timestamp() + "] [" + logLevelName(level) + "] [" + component + "] " + message;
        }

        size_t existingSize(const std::string& path) {
            std::error_code ec;
            auto size = std::filesystem::file_size(path, ec);
            return ec ? 0 : static_cast<size_t>(size);
        }

    }

    LogLevel parseLogLevel(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper == "DEBUG") return LogLevel::DEBUG;
        if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
        if (upper == "ERROR") return LogLevel::ERROR;
        if (upper == "CRITICAL") return LogLevel::CRITICAL;
        return LogLevel::INFO;
    }

    const char* logLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    Logger& Logger::instance() {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    void Logger::setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_ = path;
        currentFileSize_ = 0;
        if (path.empty()) {
            return;
        }
        logFile_.open(path, std::ios::app);
        if (!logFile_.is_open()) {
            std::cerr << "Cannot open log file " << path << std::endl;
            return;
        }
        currentFileSize_ = existingSize(path);
    }

    void Logger::setMaxFileSize(size_t maxSizeMB) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxFileBytes_ = maxSizeMB * 1024 * 1024;
    }

    void Logger::setMaxRotatedFiles(size_t maxFiles) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxRotatedFiles_ = maxFiles;
    }

    void Logger::setComponent(const std::string& component) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultComponent_ = component;
    }

    void Logger::setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleOutput_ = enabled;
    }

    void Logger::setLevel(LogLevel level) {
        currentLevel_ = level;
    }

    void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
        if (level < currentLevel_.load()) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::string entry = formatEntry(level, component.empty() ? defaultComponent_ : component, message);

        if (consoleOutput_) {
            switch (level) {
                case LogLevel::ERROR:
                case LogLevel::CRITICAL:
                    std::cerr << "\033[1;31m" << entry << "\033[0m" << std::endl;
                    break;
                case LogLevel::WARN:
                    std::cout << "\033[1;33m" << entry << "\033[0m" << std::endl;
                    break;
                default:
                    std::cout << entry << std::endl;
            }
        }

        writeToFile(entry);
    }

    void Logger::debug(const std::string& message, const std::string& component) {
        log(LogLevel::DEBUG, message, component);
    }

    void Logger::info(const std::string& message, const std::string& component) {
        log(LogLevel::INFO, message, component);
    }

    void Logger::warn(const std::string& message, const std::string& component) {
        log(LogLevel::WARN, message, component);
    }

    void Logger::error(const std::string& message, const std::string& component) {
        log(LogLevel::ERROR, message, component);
    }

    void Logger::critical(const std::string& message, const std::string& component) {
        log(LogLevel::CRITICAL, message, component);
    }

    // Called with mutex_ held.
    void Logger::writeToFile(const std::string& entry) {
        if (!logFile_.is_open()) {
            return;
        }
        logFile_ << entry << '\n';
        logFile_.flush();
        currentFileSize_ += entry.size() + 1;

        if (maxFileBytes_ > 0 && currentFileSize_ > maxFileBytes_) {
            rotate();
        }
    }

    // Called with mutex_ held.
    void Logger::rotate() {
        logFile_.close();

        namespace fs = std::filesystem;
        std::error_code ec;

        if (maxRotatedFiles_ == 0) {
            fs::remove(logFilePath_, ec);
        } else {
            fs::remove(logFilePath_ + "." + std::to_string(maxRotatedFiles_), ec);
            for (size_t i = maxRotatedFiles_; i > 1; --i) {
                std::string from = logFilePath_ + "." + std::to_string(i - 1);
                if (fs::exists(from, ec)) {
                    fs::rename(from, logFilePath_ + "." + std::to_string(i), ec);
                }
            }
            fs::rename(logFilePath_, logFilePath_ + ".1", ec);
        }
        if (ec) {
            std::cerr << "Failed to rotate log file " << logFilePath_ << ": " << ec.message() << std::endl;
        }

        logFile_.open(logFilePath_, std::ios::trunc);
        currentFileSize_ = 0;
        if (logFile_.is_open()) {
            writeToFile(formatEntry(LogLevel::INFO, "Logger", "Log file rotated"));
        }
    }

}
