#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <atomic>

namespace ChatCast {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Parse a level name ("debug", "INFO", ...). Unknown names map to INFO.
     */
    LogLevel parseLogLevel(const std::string& name);

    const char* logLevelName(LogLevel level);

    /**
     * @brief Process-wide logger writing to the console and/or a file.
     *
     * Entries look like
     *   [2026-01-31 12:00:00.123] [WARN] [RelayServer] message
     * The file is rotated once it grows past the size limit: path becomes
     * path.1, path.1 becomes path.2 and so on, keeping at most maxFiles.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setMaxRotatedFiles(size_t maxFiles);
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        // Lets callers skip building messages that would be filtered out
        bool isDebugEnabled() const { return currentLevel_.load() <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_.load() <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_.load(); }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        void writeToFile(const std::string& entry);
        void rotate();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "Relay";
        size_t maxFileBytes_ = 100 * 1024 * 1024;
        size_t maxRotatedFiles_ = 5;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;
    };

}
