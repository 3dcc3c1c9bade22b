#pragma once

#include "concurrency/Task.hpp"
#include "cache/Processor.hpp"

#include <string>
#include <utility>

namespace tt::concurrency {

class ProcessTask final : public PromisedTask<cache::ProcessResult> {
public:
    ProcessTask(cache::Processor& processor, std::string key, const cache::Processor::ReadMode mode)
        : processor_(processor), key_(std::move(key)), mode_(mode) {}

    void operator()() override {
        promise.set_value(processor_.run(key_, mode_));
    }

    void cancel() override {
        promise.set_value(processor_.abandon(key_));
    }

    [[nodiscard]] const std::string& key() const { return key_; }

private:
    cache::Processor& processor_;
    std::string key_;
    cache::Processor::ReadMode mode_;
};

}
