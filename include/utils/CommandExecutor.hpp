#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <atomic>
#include <sys/types.h>

class CommandExecutor {
public:
    // Pending -> Running -> { Completed | TimedOut | Failed }
    // 스폰 자체가 실패하면 Pending -> Failed
    enum class State {
        PENDING = 0,
        RUNNING,
        COMPLETED,
        TIMED_OUT,
        FAILED
    };

    struct CommandResult {
        State state = State::PENDING;
        pid_t pid = -1;
        int exitCode = -1;
        int termSignal = 0;
        std::string output;       // stdout + stderr, 도착 순서대로
        std::string error;        // stderr 만
        std::string spawnError;   // posix_spawnp 실패 사유
        bool truncated = false;
        std::chrono::milliseconds executionTime{0};

        bool succeeded() const { return state == State::COMPLETED; }
        bool timedOut() const { return state == State::TIMED_OUT; }
        bool failed() const { return state == State::FAILED; }
    };

    struct CommandConfig {
        std::chrono::milliseconds timeout{30000};
        size_t maxOutputSize = 16 * 1024 * 1024;
        std::chrono::milliseconds killGracePeriod{100};
    };

    explicit CommandExecutor(std::string program);

    // 인자는 셸을 거치지 않고 argv 토큰 그대로 전달된다
    CommandResult execute(const std::vector<std::string>& args, const CommandConfig& config) const;
    CommandResult execute(const std::vector<std::string>& args) const {
        return execute(args, CommandConfig{});
    }

    void setDebugArguments(bool enabled) { debugArguments_.store(enabled, std::memory_order_release); }
    bool debugArguments() const { return debugArguments_.load(std::memory_order_acquire); }

    const std::string& program() const { return program_; }

    static const char* stateToString(State state);

private:
    void terminate(pid_t pid, int& status, const CommandConfig& config) const;

    std::string program_;
    std::atomic<bool> debugArguments_{false};
};
