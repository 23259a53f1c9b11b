#include <gtest/gtest.h>
#include "utils/CommandExecutor.hpp"
#include <cerrno>
#include <csignal>
#include <fstream>
#include <future>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using std::string;
using std::vector;
using State = CommandExecutor::State;

namespace {

CommandExecutor::CommandConfig with_timeout(std::chrono::milliseconds timeout) {
    CommandExecutor::CommandConfig config;
    config.timeout = timeout;
    return config;
}

// 회수된 프로세스는 더 이상 존재하지 않는다
bool process_gone(pid_t pid) {
    return kill(pid, 0) == -1 && errno == ESRCH;
}

// 손자 프로세스는 우리가 회수하지 않으므로 좀비 상태도 종료로 본다
bool process_dead(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) {
        return true;
    }
    string line;
    std::getline(stat, line);
    auto pos = line.rfind(')');
    return pos == string::npos || pos + 2 >= line.size() || line[pos + 2] == 'Z' || line[pos + 2] == 'X';
}

}  // namespace

// NOLINTNEXTLINE
TEST(command_executor, successful_run_returns_output) {
    CommandExecutor executor("echo");
    auto result = executor.execute({"hello", "world"}, with_timeout(5s));

    EXPECT_EQ(result.state, State::COMPLETED);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "hello world\n");
    EXPECT_TRUE(result.error.empty());
    EXPECT_TRUE(process_gone(result.pid));
}

// NOLINTNEXTLINE
TEST(command_executor, arguments_are_not_shell_interpreted) {
    CommandExecutor executor("echo");
    const string hostile = "$(echo pwned); `id` | cat > /tmp/x";
    auto result = executor.execute({hostile}, with_timeout(5s));

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, hostile + "\n");
}

// NOLINTNEXTLINE
TEST(command_executor, nonzero_exit_is_failure_with_diagnostics) {
    CommandExecutor executor("sh");
    auto result = executor.execute({"-c", "echo partial; echo 'boom' >&2; exit 6"}, with_timeout(5s));

    EXPECT_EQ(result.state, State::FAILED);
    EXPECT_EQ(result.exitCode, 6);
    EXPECT_EQ(result.error, "boom\n");
    EXPECT_NE(result.output.find("partial"), string::npos);
    EXPECT_NE(result.output.find("boom"), string::npos);
    EXPECT_TRUE(result.spawnError.empty());
}

// NOLINTNEXTLINE
TEST(command_executor, combined_output_keeps_arrival_order) {
    CommandExecutor executor("sh");
    auto result = executor.execute(
        {"-c", "echo one; sleep 0.2; echo two >&2; sleep 0.2; echo three"}, with_timeout(5s));

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "one\ntwo\nthree\n");
    EXPECT_EQ(result.error, "two\n");
}

// NOLINTNEXTLINE
TEST(command_executor, missing_binary_fails_before_running) {
    CommandExecutor executor("curlgate-no-such-binary-12345");
    auto result = executor.execute({"--location", "https://example.com"}, with_timeout(5s));

    EXPECT_EQ(result.state, State::FAILED);
    EXPECT_EQ(result.pid, -1);
    EXPECT_FALSE(result.spawnError.empty());
    EXPECT_NE(result.spawnError.find("curlgate-no-such-binary-12345"), string::npos);
    EXPECT_TRUE(result.output.empty());
}

// NOLINTNEXTLINE
TEST(command_executor, deadline_kills_and_reaps_child) {
    CommandExecutor executor("sleep");
    auto start = std::chrono::steady_clock::now();
    auto result = executor.execute({"10"}, with_timeout(1s));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.state, State::TIMED_OUT);
    EXPECT_TRUE(result.timedOut());
    EXPECT_GE(elapsed, 1s);
    EXPECT_LT(elapsed, 5s);
    ASSERT_GT(result.pid, 0);
    EXPECT_TRUE(process_gone(result.pid));
}

// NOLINTNEXTLINE
TEST(command_executor, timeout_keeps_partial_output) {
    CommandExecutor executor("sh");
    auto result = executor.execute({"-c", "echo started; echo warming >&2; exec sleep 10"},
                                   with_timeout(500ms));

    EXPECT_EQ(result.state, State::TIMED_OUT);
    EXPECT_NE(result.output.find("started"), string::npos);
    EXPECT_NE(result.output.find("warming"), string::npos);
    EXPECT_EQ(result.error, "warming\n");
    EXPECT_TRUE(process_gone(result.pid));
}

// NOLINTNEXTLINE
TEST(command_executor, timeout_terminates_whole_process_group) {
    CommandExecutor executor("sh");
    // 백그라운드 손자 프로세스까지 그룹으로 정리되어야 한다
    auto result = executor.execute({"-c", "sleep 10 & echo $!; wait"}, with_timeout(500ms));

    ASSERT_EQ(result.state, State::TIMED_OUT);
    auto grandchild = static_cast<pid_t>(std::stol(result.output));
    ASSERT_GT(grandchild, 0);

    bool gone = false;
    for (int i = 0; i < 50 && !gone; ++i) {
        gone = process_dead(grandchild);
        if (!gone) {
            std::this_thread::sleep_for(20ms);
        }
    }
    EXPECT_TRUE(gone);
}

// NOLINTNEXTLINE
TEST(command_executor, child_ignoring_sigterm_is_killed) {
    CommandExecutor executor("sh");
    CommandExecutor::CommandConfig config = with_timeout(300ms);
    config.killGracePeriod = 100ms;

    auto result = executor.execute({"-c", "trap '' TERM; while true; do sleep 0.05; done"}, config);

    EXPECT_EQ(result.state, State::TIMED_OUT);
    EXPECT_TRUE(process_gone(result.pid));
}

// NOLINTNEXTLINE
TEST(command_executor, fast_exit_within_deadline_is_not_timeout) {
    CommandExecutor executor("sh");
    auto result = executor.execute({"-c", "exit 0"}, with_timeout(2s));
    EXPECT_EQ(result.state, State::COMPLETED);
}

// NOLINTNEXTLINE
TEST(command_executor, signal_termination_is_failure) {
    CommandExecutor executor("sh");
    auto result = executor.execute({"-c", "kill -9 $$"}, with_timeout(5s));

    EXPECT_EQ(result.state, State::FAILED);
    EXPECT_EQ(result.termSignal, SIGKILL);
}

// NOLINTNEXTLINE
TEST(command_executor, output_limit_truncates_without_blocking_child) {
    CommandExecutor executor("sh");
    CommandExecutor::CommandConfig config = with_timeout(10s);
    config.maxOutputSize = 1024;

    // 파이프 버퍼보다 큰 출력: 계속 읽어줘야 자식이 끝난다
    auto result = executor.execute({"-c", "head -c 1000000 /dev/zero | tr '\\0' 'a'"}, config);

    EXPECT_EQ(result.state, State::COMPLETED);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.output.size(), 1024u);
}

// NOLINTNEXTLINE
TEST(command_executor, debug_toggle_is_per_instance) {
    CommandExecutor first("echo");
    CommandExecutor second("echo");

    EXPECT_FALSE(first.debugArguments());
    first.setDebugArguments(true);
    EXPECT_TRUE(first.debugArguments());
    EXPECT_FALSE(second.debugArguments());

    auto result = first.execute({"debug"}, with_timeout(5s));
    EXPECT_TRUE(result.succeeded());
    EXPECT_TRUE(first.debugArguments());
}

// NOLINTNEXTLINE
TEST(command_executor, concurrent_executions_are_independent) {
    CommandExecutor executor("sh");

    vector<std::future<CommandExecutor::CommandResult>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [&executor, i] {
            return executor.execute({"-c", "sleep 0.1; echo " + std::to_string(i)}, with_timeout(5s));
        }));
    }
    // 타임아웃 작업이 섞여도 다른 실행에 영향이 없다
    auto slow = std::async(std::launch::async, [&executor] {
        return executor.execute({"-c", "sleep 10"}, with_timeout(300ms));
    });

    for (int i = 0; i < 8; ++i) {
        auto result = futures[i].get();
        EXPECT_TRUE(result.succeeded());
        EXPECT_EQ(result.output, std::to_string(i) + "\n");
    }
    EXPECT_TRUE(slow.get().timedOut());
}

// NOLINTNEXTLINE
TEST(command_executor, default_config_overload) {
    CommandExecutor executor("echo");
    auto result = executor.execute({"defaults"});

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "defaults\n");
}

// NOLINTNEXTLINE
TEST(command_executor, waitpid_failure_still_cleans_up_group) {
    // SIGCHLD 를 무시하면 커널이 자식을 자동 회수하므로 waitpid 가 ECHILD 로 실패한다
    struct sigaction ignore {};
    struct sigaction previous {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ASSERT_EQ(sigaction(SIGCHLD, &ignore, &previous), 0);

    CommandExecutor executor("sh");
    auto result = executor.execute({"-c", "sleep 10 & echo $!; exit 0"}, with_timeout(5s));

    sigaction(SIGCHLD, &previous, nullptr);

    EXPECT_EQ(result.state, State::FAILED);
    EXPECT_NE(result.spawnError.find("waitpid failed"), string::npos);

    // 남아 있던 손자 프로세스도 그룹째 종료되어야 한다
    ASSERT_FALSE(result.output.empty());
    auto grandchild = static_cast<pid_t>(std::stol(result.output));
    ASSERT_GT(grandchild, 0);

    bool gone = false;
    for (int i = 0; i < 50 && !gone; ++i) {
        gone = process_dead(grandchild);
        if (!gone) {
            std::this_thread::sleep_for(20ms);
        }
    }
    EXPECT_TRUE(gone);
}
