#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(size_t numThreads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // 정지된 풀이면 false
    bool submit(Task task);

    // 대기 중인 작업까지 모두 끝낸 뒤 워커 종료
    void shutdown();

    void wait();
    size_t getTaskCount() const;
    size_t size() const { return workers_.size(); }
    bool isStopped() const { return stop_.load(); }

private:
    void workerThread();

    std::vector<std::thread> workers_;
    std::queue<Task> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable finished_;
    std::atomic<bool> stop_{false};
    size_t activeTasks_ = 0;
};
