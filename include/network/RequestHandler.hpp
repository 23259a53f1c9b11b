#pragma once

#include <map>
#include <memory>
#include <string>
#include <chrono>
#include <variant>
#include "curl/CurlRunner.hpp"

struct HttpRequest {
    std::string method;
    std::string path;
    std::string contentType;
    std::map<std::string, std::string> query;
    std::string body;
};

struct HttpResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
};

// 소켓과 무관한 요청 처리 로직 (HttpServer 가 libsoup 메시지를 이것으로 변환)
class RequestHandler {
public:
    struct Settings {
        std::chrono::milliseconds defaultTimeout{30000};
        std::chrono::milliseconds maxTimeout{300000};
    };

    struct CurlJob {
        OptionSet options;
        std::chrono::milliseconds timeout{0};
        bool base64 = false;
        bool plain = false;
    };

    RequestHandler(std::shared_ptr<const CurlRunner> runner, Settings settings);

    // 검증 실패 시 바로 보낼 응답을, 통과하면 실행할 작업을 돌려준다
    std::variant<CurlJob, HttpResponse> prepareCurl(const HttpRequest& request) const;

    // 블로킹: 워커 스레드에서 호출
    HttpResponse executeCurl(const CurlJob& job) const;

    HttpResponse handleCurl(const HttpRequest& request) const;

    std::variant<std::chrono::milliseconds, HttpResponse> prepareWaiting(const HttpRequest& request) const;

    static HttpResponse waitingDone();
    static HttpResponse jsonError(int status, const std::string& message);
    static HttpResponse notFound();

    const Settings& settings() const { return settings_; }

private:
    std::shared_ptr<const CurlRunner> runner_;
    Settings settings_;
};
