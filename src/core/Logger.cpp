#include "core/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <ctime>
#include <unistd.h>

Logger::Logger() {
    // 터미널일 때만 색상 출력
    colorEnabled_ = isatty(STDOUT_FILENO) && isatty(STDERR_FILENO);
}

Logger::~Logger() {
    if (fileStream_ && fileStream_->is_open()) {
        fileStream_->close();
    }
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fileStream_ && fileStream_->is_open()) {
        fileStream_->close();
    }
    fileStream_.reset();

    if (filename.empty()) {
        return true;
    }

    auto stream = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!stream->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return false;
    }

    fileStream_ = std::move(stream);
    return true;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG_LEVEL;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void Logger::writeLog(LogLevel level, const std::string& message) {
    std::string logLine = fmt::format("[{}] [{}] {}\n",
                                      getCurrentTimestamp(), levelToString(level), message);

    std::lock_guard<std::mutex> lock(mutex_);

    // 경고 이상은 stderr
    std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
    if (colorEnabled_) {
        out << levelColor(level) << logLine << "\033[0m";
    } else {
        out << logLine;
    }
    out.flush();

    if (fileStream_ && fileStream_->is_open()) {
        *fileStream_ << logLine;
        fileStream_->flush();
    }
}

std::string Logger::getCurrentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

const char* Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE:       return "TRACE";
        case LogLevel::DEBUG_LEVEL: return "DEBUG";
        case LogLevel::INFO:        return "INFO ";
        case LogLevel::WARNING:     return "WARN ";
        case LogLevel::ERROR:       return "ERROR";
        case LogLevel::CRITICAL:    return "CRIT ";
        default:                    return "UNKN ";
    }
}

const char* Logger::levelColor(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE:       return "\033[90m";  // Dark gray
        case LogLevel::DEBUG_LEVEL: return "\033[36m";  // Cyan
        case LogLevel::INFO:        return "\033[32m";  // Green
        case LogLevel::WARNING:     return "\033[33m";  // Yellow
        case LogLevel::ERROR:       return "\033[31m";  // Red
        case LogLevel::CRITICAL:    return "\033[35m";  // Magenta
        default:                    return "\033[0m";
    }
}
