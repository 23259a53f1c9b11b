#include <gtest/gtest.h>
#include "network/HttpServer.hpp"
#include "utils/ThreadPool.hpp"
#include <atomic>

using namespace std::chrono_literals;

namespace {

std::shared_ptr<const RequestHandler> make_handler() {
    RequestHandler::Settings settings;
    settings.defaultTimeout = 5s;
    settings.maxTimeout = 1min;
    return std::make_shared<const RequestHandler>(std::make_shared<const CurlRunner>("echo"), settings);
}

gboolean mark_done(gpointer userData) {
    static_cast<std::atomic<int>*>(userData)->fetch_add(1);
    return G_SOURCE_REMOVE;
}

}  // namespace

// NOLINTNEXTLINE
TEST(http_server, drain_delivers_completions_queued_by_workers) {
    auto pool = std::make_shared<ThreadPool>(2);
    HttpServer server(make_handler(), pool);

    // 메인 루프가 멈춘 뒤에 워커가 완료 콜백을 등록하는 상황
    std::atomic<int> completed{0};
    for (int i = 0; i < 4; ++i) {
        pool->submit([&completed] {
            std::this_thread::sleep_for(50ms);
            g_idle_add(&mark_done, &completed);
        });
    }

    server.drain();

    EXPECT_TRUE(pool->isStopped());
    EXPECT_EQ(completed.load(), 4);
    EXPECT_FALSE(pool->submit([] {}));
}

// NOLINTNEXTLINE
TEST(http_server, drain_is_safe_without_start_and_twice) {
    auto pool = std::make_shared<ThreadPool>(1);
    HttpServer server(make_handler(), pool);

    server.drain();
    server.drain();
    EXPECT_TRUE(pool->isStopped());
}

// NOLINTNEXTLINE
TEST(http_server, invalid_listen_address_fails_to_start) {
    auto pool = std::make_shared<ThreadPool>(1);
    HttpServer server(make_handler(), pool);

    EXPECT_FALSE(server.start("not-an-address", 0));
    server.drain();
}
