#include "network/RequestHandler.hpp"
#include "core/Logger.hpp"
#include "curl/OptionParser.hpp"
#include "utils/Base64.hpp"
#include "utils/StringUtils.hpp"
#include <nlohmann/json.hpp>

namespace {

constexpr const char* kCurlPath = "/curl";
constexpr const char* kWaitingPrefix = "/waiting/";

bool queryFlag(const std::map<std::string, std::string>& query, const std::string& key) {
    auto it = query.find(key);
    if (it == query.end()) {
        return false;
    }
    return StringUtils::parseBool(it->second).value_or(false);
}

// 바이너리 출력이 섞여도 dump 가 실패하지 않도록 잘못된 UTF-8 은 치환
std::string dumpJson(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// "application/json; charset=utf-8" -> "application/json"
std::string mediaType(const std::string& contentType) {
    return StringUtils::toLower(StringUtils::trim(contentType.substr(0, contentType.find(';'))));
}

}  // namespace

RequestHandler::RequestHandler(std::shared_ptr<const CurlRunner> runner, Settings settings)
    : runner_(std::move(runner))
    , settings_(settings) {}

HttpResponse RequestHandler::jsonError(int status, const std::string& message) {
    HttpResponse response;
    response.status = status;
    response.body = dumpJson({{"error", message}});
    return response;
}

HttpResponse RequestHandler::notFound() {
    return jsonError(404, "Not found");
}

HttpResponse RequestHandler::waitingDone() {
    HttpResponse response;
    response.contentType = "text/plain";
    response.body = "Ok";
    return response;
}

std::variant<RequestHandler::CurlJob, HttpResponse>
RequestHandler::prepareCurl(const HttpRequest& request) const {
    if (request.path != kCurlPath) {
        return notFound();
    }
    if (request.method != "POST") {
        return jsonError(405, "Method not allowed");
    }
    if (mediaType(request.contentType) != "application/json") {
        return jsonError(400, "Content-Type must be application/json");
    }

    CurlJob job;
    job.timeout = settings_.defaultTimeout;

    auto timeoutIt = request.query.find("timeout");
    if (timeoutIt != request.query.end()) {
        auto parsed = StringUtils::parseDuration(timeoutIt->second);
        if (!parsed) {
            return jsonError(400, fmt::format("Error parsing timeout duration: invalid duration \"{}\"",
                                              timeoutIt->second));
        }
        // 1ms 미만의 양수는 0 이 되지 않도록 올림
        auto timeout = std::chrono::ceil<std::chrono::milliseconds>(*parsed);
        if (timeout.count() <= 0) {
            return jsonError(400, fmt::format("Error parsing timeout duration: \"{}\" must be positive",
                                              timeoutIt->second));
        }
        if (timeout > settings_.maxTimeout) {
            return jsonError(400, fmt::format("Error parsing timeout duration: \"{}\" exceeds maximum of {}",
                                              timeoutIt->second,
                                              StringUtils::formatDuration(settings_.maxTimeout)));
        }
        job.timeout = timeout;
    }

    std::string parseError;
    auto options = OptionParser::parse(request.body, &parseError);
    if (!options) {
        return jsonError(400, "Invalid JSON input: " + parseError);
    }

    job.options = std::move(*options);
    job.base64 = queryFlag(request.query, "base64");
    job.plain = queryFlag(request.query, "plain");
    return job;
}

HttpResponse RequestHandler::executeCurl(const CurlJob& job) const {
    auto result = runner_->run(job.options, job.timeout);

    std::string output = job.base64 ? Base64::encode(result.output) : result.output;

    switch (result.error) {
        case CurlRunner::ErrorKind::NONE:
            break;
        case CurlRunner::ErrorKind::UNAUTHORIZED_OPTION:
            return jsonError(400, result.message);
        case CurlRunner::ErrorKind::TIMEOUT: {
            HttpResponse response;
            response.status = 504;
            response.body = dumpJson({{"error", result.message}, {"result", output}});
            return response;
        }
        case CurlRunner::ErrorKind::PROCESS_FAILURE: {
            HttpResponse response;
            response.status = 502;
            response.body = dumpJson({{"error", result.message}, {"result", output}});
            return response;
        }
    }

    HttpResponse response;
    if (job.plain) {
        response.contentType = "text/plain";
        response.body = std::move(output);
    } else {
        response.body = dumpJson({{"result", output}});
    }
    return response;
}

HttpResponse RequestHandler::handleCurl(const HttpRequest& request) const {
    auto prepared = prepareCurl(request);
    if (auto* response = std::get_if<HttpResponse>(&prepared)) {
        return *response;
    }
    return executeCurl(std::get<CurlJob>(prepared));
}

std::variant<std::chrono::milliseconds, HttpResponse>
RequestHandler::prepareWaiting(const HttpRequest& request) const {
    if (!StringUtils::startsWith(request.path, kWaitingPrefix)) {
        return notFound();
    }

    auto milli = StringUtils::parseNonNegativeInt(request.path.substr(std::string(kWaitingPrefix).size()));
    if (!milli) {
        return jsonError(400, "Invalid milliseconds");
    }
    return std::chrono::milliseconds(*milli);
}
