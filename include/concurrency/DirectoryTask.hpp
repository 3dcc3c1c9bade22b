#pragma once

#include "concurrency/Task.hpp"
#include "cache/DirectoryAggregator.hpp"

#include <string>
#include <utility>

namespace tt::concurrency {

class DirectoryTask final : public PromisedTask<cache::DirectoryResult> {
public:
    DirectoryTask(cache::DirectoryAggregator& aggregator, std::string path, const bool recursive)
        : aggregator_(aggregator), path_(std::move(path)), recursive_(recursive) {}

    void operator()() override {
        promise.set_value(aggregator_.aggregate(path_, recursive_));
    }

    void cancel() override {
        promise.set_value(aggregator_.abandon(path_));
    }

private:
    cache::DirectoryAggregator& aggregator_;
    std::string path_;
    bool recursive_;
};

}
