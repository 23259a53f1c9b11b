#include <gtest/gtest.h>
#include "utils/ThreadPool.hpp"
#include <atomic>
#include <stdexcept>

// NOLINTNEXTLINE
TEST(thread_pool, runs_all_submitted_tasks) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.submit([&counter] { ++counter; }));
    }
    pool.wait();

    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.getTaskCount(), 0u);
}

// NOLINTNEXTLINE
TEST(thread_pool, task_exception_does_not_kill_worker) {
    ThreadPool pool(1);
    std::atomic<int> counter{0};

    pool.submit([] { throw std::runtime_error("task failed"); });
    pool.submit([&counter] { ++counter; });
    pool.wait();

    EXPECT_EQ(counter.load(), 1);
}

// NOLINTNEXTLINE
TEST(thread_pool, shutdown_drains_queue_and_rejects_new_tasks) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};

    for (int i = 0; i < 10; ++i) {
        pool.submit([&counter] { ++counter; });
    }
    pool.shutdown();

    EXPECT_EQ(counter.load(), 10);
    EXPECT_TRUE(pool.isStopped());
    EXPECT_FALSE(pool.submit([&counter] { ++counter; }));
    EXPECT_EQ(counter.load(), 10);

    // 두 번 호출해도 안전
    pool.shutdown();
}

// NOLINTNEXTLINE
TEST(thread_pool, zero_threads_falls_back_to_one) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}
