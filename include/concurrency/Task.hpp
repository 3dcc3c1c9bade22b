#pragma once

#include <future>
#include <stdexcept>

namespace tt::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Called instead of operator() when the owning pool drops the task on shutdown.
    virtual void cancel() {}
};

template <typename Result>
struct PromisedTask : Task {
    std::promise<Result> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<Result> p) : promise(std::move(p)) {}

    std::future<Result> getFuture() { return promise.get_future(); }

    void operator()() override { throw std::runtime_error("PromisedTask must implement operator()()"); }
};

}
