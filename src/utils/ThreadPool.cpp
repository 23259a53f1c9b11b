#include "utils/ThreadPool.hpp"
#include "core/Logger.hpp"

ThreadPool::ThreadPool(size_t numThreads) {
    if (numThreads == 0) {
        numThreads = 1;
    }
    LOG_INFO("Creating thread pool with {} threads", numThreads);

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::workerThread, this);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stop_) {
            LOG_WARNING("Task submitted to stopped thread pool");
            return false;
        }
        tasks_.push(std::move(task));
    }

    condition_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_INFO("Thread pool stopped");
}

void ThreadPool::wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    finished_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

size_t ThreadPool::getTaskCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size() + activeTasks_;
}

void ThreadPool::workerThread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++activeTasks_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Exception in thread pool task: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            if (tasks_.empty() && activeTasks_ == 0) {
                finished_.notify_all();
            }
        }
    }
}
