#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "curl/CurlRunner.hpp"
#include "network/HttpServer.hpp"
#include "network/RequestHandler.hpp"
#include "utils/StringUtils.hpp"
#include "utils/ThreadPool.hpp"
#include <fmt/ranges.h>
#include <glib-unix.h>
#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iostream>

Application::~Application() {
    shutdown();
}

bool Application::initialize(int argc, char* argv[]) {
    setState(State::INITIALIZING);

    try {
        // 1. 명령줄 인자 파싱
        if (!parseArguments(argc, argv)) {
            LOG_ERROR("Failed to parse arguments");
            setState(State::ERROR);
            return false;
        }

        // 2. 설정 파일 로드
        if (!loadConfigurations()) {
            LOG_ERROR("Failed to load configurations");
            setState(State::ERROR);
            return false;
        }

        // 3. 로깅 초기화 (설정의 레벨/파일 반영)
        if (!initializeLogging()) {
            setState(State::ERROR);
            return false;
        }

        // 4. curl 실행기, 워커 풀, HTTP 서버 생성
        if (!createServices()) {
            LOG_ERROR("Failed to create services");
            setState(State::ERROR);
            return false;
        }

        // 5. 메인 루프 생성
        mainLoop_ = g_main_loop_new(nullptr, FALSE);
        if (!mainLoop_) {
            LOG_ERROR("Failed to create main loop");
            setState(State::ERROR);
            return false;
        }

        sigintSource_ = g_unix_signal_add(SIGINT, &Application::onTerminationSignal, this);
        sigtermSource_ = g_unix_signal_add(SIGTERM, &Application::onTerminationSignal, this);

        setState(State::INITIALIZED);
        LOG_INFO("Application initialized successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception during initialization: {}", e.what());
        setState(State::ERROR);
        return false;
    }
}

bool Application::parseArguments(int argc, char* argv[]) {
    const struct option longOptions[] = {
        {"config", required_argument, nullptr, 'c'},
        {"log-level", required_argument, nullptr, 'l'},
        {"port", required_argument, nullptr, 'p'},
        {"debug", no_argument, nullptr, 'd'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:l:p:dh", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                configPath_ = optarg;
                break;

            case 'l': {
                std::string level = optarg;
                if (!Logger::parseLevel(level)) {
                    std::cerr << "Invalid log level: " << level << std::endl;
                    return false;
                }
                logLevelOverride_ = level;
                break;
            }

            case 'p': {
                auto port = StringUtils::parseNonNegativeInt(optarg);
                if (!port || *port == 0 || *port > 65535) {
                    std::cerr << "Invalid port: " << optarg << std::endl;
                    return false;
                }
                portOverride_ = static_cast<int>(*port);
                break;
            }

            case 'd':
                debugOverride_ = true;
                break;

            case 'h':
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  -c, --config <file>     Configuration file path (default: config.json)\n"
                          << "  -l, --log-level <level> Log level (trace|debug|info|warning|error|critical)\n"
                          << "  -p, --port <port>       HTTP port\n"
                          << "  -d, --debug             Log curl arguments before execution\n"
                          << "  -h, --help              Show this help message\n";
                exit(EXIT_SUCCESS);

            default:
                return false;
        }
    }

    return true;
}

bool Application::loadConfigurations() {
    auto& config = Config::getInstance();
    if (!config.loadConfig(configPath_)) {
        LOG_ERROR("Failed to load config from: {}", configPath_);
        return false;
    }

    auto& serverConfig = config.getServerConfig();
    if (logLevelOverride_) serverConfig.logLevel = *logLevelOverride_;
    if (portOverride_) serverConfig.port = *portOverride_;
    if (debugOverride_) serverConfig.debugArgs = true;

    LOG_DEBUG("Effective configuration: {}", config.toJson().dump());
    return true;
}

bool Application::initializeLogging() {
    const auto& serverConfig = Config::getInstance().getServerConfig();

    if (auto level = Logger::parseLevel(serverConfig.logLevel)) {
        Logger::getInstance().setLogLevel(*level);
    }

    if (!serverConfig.logFile.empty()) {
        if (!Logger::getInstance().setLogFile(serverConfig.logFile)) {
            LOG_ERROR("Failed to open log file: {}", serverConfig.logFile);
            return false;
        }
        LOG_INFO("Logging to: {}", serverConfig.logFile);
    }

    return true;
}

bool Application::createServices() {
    const auto& serverConfig = Config::getInstance().getServerConfig();

    runner_ = std::make_shared<CurlRunner>(serverConfig.curlPath, serverConfig.maxOutputBytes);
    runner_->setDebugArguments(serverConfig.debugArgs);
    LOG_INFO("curl binary: {}, allowed options: {}", runner_->curlPath(),
             fmt::join(runner_->allowedOptions(), " "));

    workerPool_ = std::make_shared<ThreadPool>(static_cast<size_t>(serverConfig.workerThreads));

    RequestHandler::Settings settings;
    settings.defaultTimeout = serverConfig.defaultTimeout;
    settings.maxTimeout = serverConfig.maxTimeout;
    requestHandler_ = std::make_shared<RequestHandler>(runner_, settings);

    httpServer_ = std::make_unique<HttpServer>(requestHandler_, workerPool_);
    return httpServer_->start(serverConfig.listenAddress, serverConfig.port);
}

int Application::run() {
    if (getState() != State::INITIALIZED) {
        LOG_ERROR("Application is not initialized");
        return EXIT_FAILURE;
    }

    setState(State::RUNNING);
    LOG_INFO("Entering main loop");
    g_main_loop_run(mainLoop_);

    shutdown();
    return EXIT_SUCCESS;
}

void Application::shutdown() {
    State state = getState();
    if (state == State::SHUTTING_DOWN || state == State::STOPPED || state == State::UNKNOWN) {
        return;
    }
    setState(State::SHUTTING_DOWN);

    // 실행 중인 curl 은 각자의 데드라인 안에서 끝난다
    if (httpServer_) {
        httpServer_->drain();
    } else if (workerPool_) {
        workerPool_->shutdown();
    }

    if (sigintSource_) { g_source_remove(sigintSource_); sigintSource_ = 0; }
    if (sigtermSource_) { g_source_remove(sigtermSource_); sigtermSource_ = 0; }

    if (mainLoop_) {
        g_main_loop_unref(mainLoop_);
        mainLoop_ = nullptr;
    }

    setState(State::STOPPED);
    LOG_INFO("Application stopped");
}

gboolean Application::onTerminationSignal(gpointer userData) {
    auto* app = static_cast<Application*>(userData);
    LOG_INFO("Termination signal received, stopping");

    if (app->mainLoop_ && g_main_loop_is_running(app->mainLoop_)) {
        g_main_loop_quit(app->mainLoop_);
    }
    return G_SOURCE_CONTINUE;
}

void Application::setState(State newState) {
    State oldState = state_.exchange(newState);
    if (oldState != newState) {
        LOG_DEBUG("State changed: {} -> {}", stateToString(oldState), stateToString(newState));
    }
}

const char* Application::stateToString(State state) {
    switch (state) {
        case State::UNKNOWN:       return "UNKNOWN";
        case State::INITIALIZING:  return "INITIALIZING";
        case State::INITIALIZED:   return "INITIALIZED";
        case State::RUNNING:       return "RUNNING";
        case State::SHUTTING_DOWN: return "SHUTTING_DOWN";
        case State::STOPPED:       return "STOPPED";
        case State::ERROR:         return "ERROR";
        default:                   return "INVALID";
    }
}
