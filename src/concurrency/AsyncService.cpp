#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace tt::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    // Derived destructors must call stop() themselves; by now runLoop() is gone.
    if (worker_.joinable()) {
        interruptFlag_.store(true, std::memory_order_release);
        sleepCv_.notify_all();
        if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
        else worker_.detach();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release); {
        std::scoped_lock lock(sleepMutex_);
        woken_ = false;
    }
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::tokentally()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            log::Registry::tokentally()->error("[{}] Service encountered an unknown error", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::tokentally()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::tokentally()->debug("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release); {
        std::scoped_lock lock(sleepMutex_);
        woken_ = true;
    }
    sleepCv_.notify_all();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::tokentally()->debug("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::tokentally()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::wake() { {
        std::scoped_lock lock(sleepMutex_);
        woken_ = true;
    }
    sleepCv_.notify_all();
}

void AsyncService::lazySleep(const std::chrono::steady_clock::duration duration) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, duration, [this] { return woken_ || shouldStop(); });
    woken_ = false;
}
