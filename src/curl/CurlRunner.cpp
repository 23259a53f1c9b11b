#include "curl/CurlRunner.hpp"
#include "core/Logger.hpp"

namespace {

std::string describeFailure(const CommandExecutor::CommandResult& result) {
    if (!result.spawnError.empty()) {
        return result.spawnError;
    }

    std::string detail = result.termSignal != 0
        ? fmt::format("terminated by signal {}", result.termSignal)
        : fmt::format("exit status {}", result.exitCode);

    // curl 자체 진단 메시지의 첫 줄을 덧붙인다
    auto end = result.error.find('\n');
    std::string firstLine = result.error.substr(0, end);
    if (!firstLine.empty()) {
        detail += ": " + firstLine;
    }
    return detail;
}

}  // namespace

CurlRunner::CurlRunner(std::string curlPath, size_t maxOutputSize)
    : executor_(std::move(curlPath))
    , maxOutputSize_(maxOutputSize) {}

const char* CurlRunner::errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                return "none";
        case ErrorKind::UNAUTHORIZED_OPTION: return "unauthorized_option";
        case ErrorKind::TIMEOUT:             return "timeout";
        case ErrorKind::PROCESS_FAILURE:     return "process_failure";
        default:                             return "unknown";
    }
}

CurlRunner::ExecutionResult
CurlRunner::run(const OptionSet& options, std::chrono::milliseconds timeout) const {
    ExecutionResult result;

    ArgumentList args;
    try {
        args = OptionSanitizer::sanitize(options);
    } catch (const UnauthorizedOptionError& e) {
        LOG_WARNING("Rejected request: {}", e.what());
        result.error = ErrorKind::UNAUTHORIZED_OPTION;
        result.rejectedOption = e.option();
        result.message = e.what();
        return result;
    }

    CommandExecutor::CommandConfig config;
    config.timeout = timeout;
    config.maxOutputSize = maxOutputSize_;

    auto commandResult = executor_.execute(args, config);
    std::string failure = commandResult.failed() ? describeFailure(commandResult) : std::string();

    result.output = std::move(commandResult.output);
    result.errorOutput = std::move(commandResult.error);
    result.exitCode = commandResult.exitCode;
    result.truncated = commandResult.truncated;
    result.executionTime = commandResult.executionTime;

    switch (commandResult.state) {
        case CommandExecutor::State::COMPLETED:
            result.error = ErrorKind::NONE;
            break;
        case CommandExecutor::State::TIMED_OUT:
            result.error = ErrorKind::TIMEOUT;
            result.message = "request timed out";
            break;
        default:
            result.error = ErrorKind::PROCESS_FAILURE;
            result.message = "curl failed: " + failure;
            LOG_WARNING("{}", result.message);
            break;
    }

    return result;
}
