#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <optional>
#include <atomic>
#include <fmt/format.h>

// DEBUG 매크로 충돌 방지
#ifdef DEBUG
#undef DEBUG
#endif

enum class LogLevel {
    TRACE = 0,
    DEBUG_LEVEL,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level) { minLevel_.store(level); }
    bool isEnabled(LogLevel level) const { return level >= minLevel_.load(); }

    bool setLogFile(const std::string& filename);

    // "trace" | "debug" | "info" | "warning" | "error" | "critical"
    static std::optional<LogLevel> parseLevel(const std::string& name);

    template<typename... Args>
    void log(LogLevel level, const std::string& format, Args&&... args) {
        if (!isEnabled(level)) return;

        std::string message;
        if constexpr (sizeof...(args) == 0) {
            message = format;
        } else {
            try {
                message = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
            } catch (const fmt::format_error& e) {
                message = format + " [format error: " + e.what() + "]";
            }
        }
        writeLog(level, message);
    }

private:
    Logger();
    ~Logger();

    void writeLog(LogLevel level, const std::string& message);
    std::string getCurrentTimestamp() const;
    const char* levelToString(LogLevel level) const;
    const char* levelColor(LogLevel level) const;

    std::mutex mutex_;
    std::unique_ptr<std::ofstream> fileStream_;
    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    bool colorEnabled_ = false;
};

#define LOG_TRACE(...) Logger::getInstance().log(LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::getInstance().log(LogLevel::DEBUG_LEVEL, __VA_ARGS__)
#define LOG_INFO(...) Logger::getInstance().log(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARNING(...) Logger::getInstance().log(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERROR(...) Logger::getInstance().log(LogLevel::ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) Logger::getInstance().log(LogLevel::CRITICAL, __VA_ARGS__)
