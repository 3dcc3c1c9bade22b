#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

using namespace tt::concurrency;

ThreadPool::ThreadPool(std::string name, unsigned int nThreads)
    : name_(std::move(name)), stopFlag(false) {
    if (nThreads == 0) nThreads = 1;
    for (unsigned int i = 0; i < nThreads; ++i) {
        spawnWorker();
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop(std::chrono::milliseconds gracefulTimeout) {
    std::queue<std::shared_ptr<Task> > dropped; {
        std::scoped_lock lock(mutex);
        if (stopFlag.exchange(true) && threads_.empty()) return;
        std::swap(queue, dropped);
    }
    cv.notify_all();

    while (!dropped.empty()) {
        if (const auto task = dropped.front()) task->cancel();
        dropped.pop();
    }

    const auto start = std::chrono::steady_clock::now();
    for (auto& t : threads_) {
        if (!t.joinable()) continue;
        if (std::this_thread::get_id() != t.get_id()) t.join();
        else t.detach();
    }

    const auto elapsed = std::chrono::steady_clock::now() - start;
    if (elapsed > gracefulTimeout)
        log::Registry::tokentally()->warn("[ThreadPool:{}] Workers took {}ms to drain on shutdown", name_,
                                          std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

    threads_.clear();
}

bool ThreadPool::submit(std::shared_ptr<Task> task) { {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) return false;
        queue.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;
            try {
                (*task)();
            } catch (const std::exception& e) {
                log::Registry::tokentally()->error("[ThreadPool:{}] Task failed: {}", name_, e.what());
            } catch (...) {
                log::Registry::tokentally()->error("[ThreadPool:{}] Task failed with an unknown error", name_);
            }
        }
    });
}
