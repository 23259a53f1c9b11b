#include "utils/CommandExecutor.hpp"
#include "core/Logger.hpp"
#include <fmt/ranges.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};

class Pipe {
public:
    Pipe() = default;
    ~Pipe() { closeRead(); closeWrite(); }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    // O_CLOEXEC: 동시에 스폰되는 다른 자식에게 fd가 새지 않도록
    bool open() { return pipe2(fds_, O_CLOEXEC) == 0; }

    int readEnd() const { return fds_[0]; }
    int writeEnd() const { return fds_[1]; }

    void closeRead() {
        if (fds_[0] != -1) { close(fds_[0]); fds_[0] = -1; }
    }
    void closeWrite() {
        if (fds_[1] != -1) { close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2] = {-1, -1};
};

class SpawnActions {
public:
    SpawnActions() {
        posix_spawn_file_actions_init(&actions_);
        posix_spawnattr_init(&attr_);
    }
    ~SpawnActions() {
        posix_spawn_file_actions_destroy(&actions_);
        posix_spawnattr_destroy(&attr_);
    }

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    posix_spawn_file_actions_t* actions() { return &actions_; }
    posix_spawnattr_t* attr() { return &attr_; }

private:
    posix_spawn_file_actions_t actions_;
    posix_spawnattr_t attr_;
};

void appendLimited(std::string& buffer, const char* data, size_t size,
                   size_t limit, bool& truncated) {
    if (buffer.size() >= limit) {
        truncated = true;
        return;
    }
    size_t room = limit - buffer.size();
    if (size > room) {
        truncated = true;
        size = room;
    }
    buffer.append(data, size);
}

enum class ReadStatus { DATA, WOULD_BLOCK, CLOSED };

ReadStatus readChunk(int fd, bool isStderr, CommandExecutor::CommandResult& result, size_t limit) {
    std::array<char, 4096> buffer;
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
        appendLimited(result.output, buffer.data(), static_cast<size_t>(n), limit, result.truncated);
        if (isStderr) {
            appendLimited(result.error, buffer.data(), static_cast<size_t>(n), limit, result.truncated);
        }
        return ReadStatus::DATA;
    }
    if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return ReadStatus::WOULD_BLOCK;
    }
    return ReadStatus::CLOSED;
}

// 자식 종료 후 파이프에 남은 데이터를 모두 읽는다
void drain(std::array<pollfd, 2>& fds, CommandExecutor::CommandResult& result, size_t limit) {
    for (size_t i = 0; i < fds.size(); ++i) {
        ReadStatus status = ReadStatus::DATA;
        while (fds[i].fd != -1 && status == ReadStatus::DATA) {
            status = readChunk(fds[i].fd, i == 1, result, limit);
            if (status == ReadStatus::CLOSED) {
                fds[i].fd = -1;
            }
        }
    }
}

void applyExitStatus(int status, CommandExecutor::CommandResult& result) {
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.state = result.exitCode == 0 ? CommandExecutor::State::COMPLETED
                                            : CommandExecutor::State::FAILED;
    } else if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
        result.exitCode = -result.termSignal;
        result.state = CommandExecutor::State::FAILED;
    }
}

pid_t waitNoHang(pid_t pid, int& status) {
    pid_t ret;
    do {
        ret = waitpid(pid, &status, WNOHANG);
    } while (ret == -1 && errno == EINTR);
    return ret;
}

}  // namespace

CommandExecutor::CommandExecutor(std::string program)
    : program_(std::move(program)) {}

const char* CommandExecutor::stateToString(State state) {
    switch (state) {
        case State::PENDING:   return "pending";
        case State::RUNNING:   return "running";
        case State::COMPLETED: return "completed";
        case State::TIMED_OUT: return "timed_out";
        case State::FAILED:    return "failed";
        default:               return "unknown";
    }
}

CommandExecutor::CommandResult
CommandExecutor::execute(const std::vector<std::string>& args,
                         const CommandConfig& config) const {
    CommandResult result;

    if (debugArguments()) {
        LOG_INFO("Executing {} {}", program_, fmt::join(args, " "));
    }

    auto startTime = std::chrono::steady_clock::now();
    auto finish = [&result, startTime]() {
        result.executionTime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);
    };

    Pipe stdoutPipe, stderrPipe;
    if (!stdoutPipe.open() || !stderrPipe.open()) {
        result.state = State::FAILED;
        result.spawnError = fmt::format("failed to create pipes: {}", std::strerror(errno));
        LOG_ERROR("{}", result.spawnError);
        finish();
        return result;
    }

    SpawnActions spawn;
    posix_spawn_file_actions_addopen(spawn.actions(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(spawn.actions(), stdoutPipe.writeEnd(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(spawn.actions(), stderrPipe.writeEnd(), STDERR_FILENO);

    // 새 프로세스 그룹: 타임아웃 시 그룹 전체를 정리
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    sigaddset(&defaultSignals, SIGINT);
    sigaddset(&defaultSignals, SIGTERM);
    sigaddset(&defaultSignals, SIGHUP);
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    posix_spawnattr_setflags(spawn.attr(),
        POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
    posix_spawnattr_setpgroup(spawn.attr(), 0);
    posix_spawnattr_setsigdefault(spawn.attr(), &defaultSignals);
    posix_spawnattr_setsigmask(spawn.attr(), &emptyMask);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program_.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int spawnRet = posix_spawnp(&pid, program_.c_str(), spawn.actions(), spawn.attr(),
                                argv.data(), environ);
    if (spawnRet != 0) {
        result.state = State::FAILED;
        result.spawnError = fmt::format("failed to start {}: {}", program_, std::strerror(spawnRet));
        LOG_ERROR("{}", result.spawnError);
        finish();
        return result;
    }

    result.pid = pid;
    result.state = State::RUNNING;

    // 부모는 쓰기 끝을 닫아야 자식 종료 시 EOF를 받는다
    stdoutPipe.closeWrite();
    stderrPipe.closeWrite();
    fcntl(stdoutPipe.readEnd(), F_SETFL, fcntl(stdoutPipe.readEnd(), F_GETFL, 0) | O_NONBLOCK);
    fcntl(stderrPipe.readEnd(), F_SETFL, fcntl(stderrPipe.readEnd(), F_GETFL, 0) | O_NONBLOCK);

    std::array<pollfd, 2> fds{};
    fds[0] = {stdoutPipe.readEnd(), POLLIN, 0};
    fds[1] = {stderrPipe.readEnd(), POLLIN, 0};

    auto deadline = startTime + config.timeout;

    // 종료 판정은 이 루프 한 곳에서만: 자연 종료를 먼저 확인하고 그 다음 데드라인
    while (result.state == State::RUNNING) {
        int status = 0;
        pid_t ret = waitNoHang(pid, status);
        if (ret == pid) {
            drain(fds, result, config.maxOutputSize);
            applyExitStatus(status, result);
            break;
        }
        if (ret == -1) {
            result.state = State::FAILED;
            result.spawnError = fmt::format("waitpid failed: {}", std::strerror(errno));
            LOG_ERROR("{}", result.spawnError);
            // 상태를 알 수 없어도 그룹은 정리하고 회수를 시도한다
            terminate(pid, status, config);
            drain(fds, result, config.maxOutputSize);
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOG_WARNING("{} (pid {}) timed out after {}ms", program_, pid, config.timeout.count());
            terminate(pid, status, config);
            drain(fds, result, config.maxOutputSize);
            result.state = State::TIMED_OUT;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int pollTimeout = static_cast<int>(std::max<std::chrono::milliseconds::rep>(
            1, std::min(remaining, kPollInterval).count()));

        bool streamsOpen = fds[0].fd != -1 || fds[1].fd != -1;
        if (!streamsOpen) {
            // 두 스트림이 모두 닫혔으면 종료만 기다린다
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(pollTimeout, 10)));
            continue;
        }

        int ready = poll(fds.data(), fds.size(), pollTimeout);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("poll failed: {}", std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd == -1) continue;
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                if (readChunk(fds[i].fd, i == 1, result, config.maxOutputSize) == ReadStatus::CLOSED) {
                    fds[i].fd = -1;
                }
            }
        }
    }

    finish();

    if (result.truncated) {
        LOG_WARNING("{} output truncated at {} bytes", program_, config.maxOutputSize);
    }
    LOG_DEBUG("{} finished: state={}, exit={}, time={}ms, output_size={}, error_size={}",
              program_, stateToString(result.state), result.exitCode,
              result.executionTime.count(), result.output.size(), result.error.size());

    return result;
}

void CommandExecutor::terminate(pid_t pid, int& status, const CommandConfig& config) const {
    if (killpg(pid, SIGTERM) == -1 && errno == ESRCH) {
        kill(pid, SIGTERM);
    }

    auto graceDeadline = std::chrono::steady_clock::now() + config.killGracePeriod;
    while (std::chrono::steady_clock::now() < graceDeadline) {
        if (waitNoHang(pid, status) == pid) {
            // 남은 그룹 구성원 정리
            killpg(pid, SIGKILL);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (killpg(pid, SIGKILL) == -1 && errno == ESRCH) {
        kill(pid, SIGKILL);
    }

    // 좀비가 남지 않도록 반드시 회수
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}
