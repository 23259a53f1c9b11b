#pragma once

#include <chrono>
#include <string>
#include "curl/OptionSanitizer.hpp"
#include "utils/CommandExecutor.hpp"

class CurlRunner {
public:
    enum class ErrorKind {
        NONE = 0,
        UNAUTHORIZED_OPTION,
        TIMEOUT,
        PROCESS_FAILURE
    };

    struct ExecutionResult {
        ErrorKind error = ErrorKind::NONE;
        std::string output;         // stdout + stderr
        std::string errorOutput;    // stderr 만
        std::string message;        // 오류 설명 (성공 시 빈 문자열)
        std::string rejectedOption; // UNAUTHORIZED_OPTION 일 때만
        int exitCode = -1;
        bool truncated = false;
        std::chrono::milliseconds executionTime{0};

        bool ok() const { return error == ErrorKind::NONE; }
    };

    explicit CurlRunner(std::string curlPath = "curl", size_t maxOutputSize = 16 * 1024 * 1024);

    ExecutionResult run(const OptionSet& options, std::chrono::milliseconds timeout) const;

    void setDebugArguments(bool enabled) { executor_.setDebugArguments(enabled); }
    bool debugArguments() const { return executor_.debugArguments(); }

    const std::set<std::string>& allowedOptions() const { return OptionSanitizer::allowedOptions(); }
    const std::string& curlPath() const { return executor_.program(); }

    static const char* errorKindToString(ErrorKind kind);

private:
    CommandExecutor executor_;
    size_t maxOutputSize_;
};
