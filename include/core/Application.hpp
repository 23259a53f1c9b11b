#pragma once

#include <memory>
#include <atomic>
#include <optional>
#include <string>
#include <glib.h>

class CurlRunner;
class ThreadPool;
class RequestHandler;
class HttpServer;

class Application {
public:
    static Application& getInstance() {
        static Application instance;
        return instance;
    }

    // 생명 주기
    bool initialize(int argc, char* argv[]);
    int run();
    void shutdown();

    enum class State {
        UNKNOWN = 0,
        INITIALIZING,
        INITIALIZED,
        RUNNING,
        SHUTTING_DOWN,
        STOPPED,
        ERROR
    };

    State getState() const { return state_.load(); }

private:
    Application() = default;
    ~Application();

    // 초기화 단계들
    bool parseArguments(int argc, char* argv[]);
    bool loadConfigurations();
    bool initializeLogging();
    bool createServices();

    static gboolean onTerminationSignal(gpointer userData);

    void setState(State newState);
    static const char* stateToString(State state);

    std::atomic<State> state_{State::UNKNOWN};

    // 명령줄 옵션 (설정 파일보다 우선)
    std::string configPath_ = "config.json";
    std::optional<std::string> logLevelOverride_;
    std::optional<int> portOverride_;
    bool debugOverride_ = false;

    std::shared_ptr<CurlRunner> runner_;
    std::shared_ptr<ThreadPool> workerPool_;
    std::shared_ptr<RequestHandler> requestHandler_;
    std::unique_ptr<HttpServer> httpServer_;

    GMainLoop* mainLoop_ = nullptr;
    guint sigintSource_ = 0;
    guint sigtermSource_ = 0;
};
