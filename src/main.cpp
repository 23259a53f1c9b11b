#include "core/Application.hpp"
#include "core/Logger.hpp"
#include <csignal>
#include <cstdlib>
#include <exception>

int main(int argc, char* argv[]) {
    // 끊긴 클라이언트 소켓에 쓰다가 종료되지 않도록
    std::signal(SIGPIPE, SIG_IGN);

    auto& app = Application::getInstance();

    try {
        if (!app.initialize(argc, argv)) {
            LOG_CRITICAL("Failed to initialize application");
            app.shutdown();
            return EXIT_FAILURE;
        }

        int exitCode = app.run();
        LOG_INFO("Application exited with code {}", exitCode);
        return exitCode;

    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        app.shutdown();
        return EXIT_FAILURE;
    }
}
