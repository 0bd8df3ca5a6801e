#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <atomic>

namespace SettleFS {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Rotate once the file grows past this
        void setComponent(const std::string& component); // Used when a call passes no component
        void setConsoleOutput(bool enabled);

        // Level checking for conditional logging (avoid string construction overhead)
        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        // Helper methods
        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        /**
         * @brief Parse "debug", "info", "warn", "error" or "critical" (any case)
         * @return fallback when the name is not recognized
         */
        static LogLevel levelFromString(const std::string& name, LogLevel fallback = LogLevel::INFO);
        static std::string levelToString(LogLevel level);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "SettleFS";
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;

        std::string getCurrentTime();
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}
