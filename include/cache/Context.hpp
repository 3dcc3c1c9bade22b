#pragma once

#include "cache/Governor.hpp"
#include "cache/Store.hpp"
#include "cache/WorkQueue.hpp"
#include "config/Config.hpp"
#include "types/stats/CacheStats.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace tt::cache {

// Host-supplied predicates. Either may be left empty.
struct Hooks {
    std::function<bool(const std::string&)> isActive;   // key is in interactive focus
    std::function<bool()> isBusy;                       // host wants the CPU right now
};

/**
 * @brief Everything one cache instance shares between threads.
 *
 * store, queue and processing are guarded by `mutex`. The config and the
 * governor derived from it are swapped as a whole under their own lock and
 * handed out as shared_ptr-to-const snapshots, so readers never block a
 * reconfiguration and never see a half-updated policy.
 */
class Context {
public:
    explicit Context(config::CacheConfig cfg, Hooks hooks = {});

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    mutable std::mutex mutex;
    types::CacheStats stats;
    Store store{&stats};
    WorkQueue queue;
    std::unordered_set<std::string> processing;

    [[nodiscard]] std::shared_ptr<const config::CacheConfig> config() const;
    [[nodiscard]] std::shared_ptr<const Governor> governor() const;

    // Validates, then swaps config and governor. Throws std::invalid_argument.
    void replaceConfig(config::CacheConfig cfg);

    [[nodiscard]] bool isActive(const std::string& key) const;
    [[nodiscard]] bool isBusy() const { return governor()->hostBusy(); }

    // Locks `mutex`. False if the key is already being processed.
    bool tryClaim(const std::string& key);
    void release(const std::string& key);

    Store::SweepResult sweep(types::Clock::time_point now);

private:
    mutable std::mutex configMutex_;
    std::shared_ptr<const config::CacheConfig> config_;
    std::shared_ptr<const Governor> governor_;
    Hooks hooks_;
};

}
