#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include <chrono>

namespace tt::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(std::string name, unsigned int nThreads = 1);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void stop(std::chrono::milliseconds gracefulTimeout = std::chrono::milliseconds(1200));

    // Returns false once the pool is stopping; the task is not run.
    bool submit(std::shared_ptr<Task> task);

private:
    void spawnWorker();

    std::string name_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
