#include "cache/Context.hpp"
#include "log/Registry.hpp"

using namespace tt::cache;
using namespace tt::config;

Context::Context(CacheConfig cfg, Hooks hooks) : hooks_(std::move(hooks)) {
    replaceConfig(std::move(cfg));
}

std::shared_ptr<const CacheConfig> Context::config() const {
    std::scoped_lock lock(configMutex_);
    return config_;
}

std::shared_ptr<const Governor> Context::governor() const {
    std::scoped_lock lock(configMutex_);
    return governor_;
}

void Context::replaceConfig(CacheConfig cfg) {
    validate(cfg);

    auto governor = std::make_shared<const Governor>(cfg, hooks_.isBusy);
    const auto maxQueueLength = cfg.max_queue_length;
    auto shared = std::make_shared<const CacheConfig>(std::move(cfg)); {
        std::scoped_lock lock(configMutex_);
        config_ = std::move(shared);
        governor_ = std::move(governor);
    }

    std::scoped_lock lock(mutex);
    queue.setMaxLength(maxQueueLength);
}

bool Context::isActive(const std::string& key) const {
    if (!hooks_.isActive) return false;
    try {
        return hooks_.isActive(key);
    } catch (const std::exception& e) {
        log::Registry::processor()->warn("[Context] isActive predicate failed for {}: {}", key, e.what());
        return false;
    } catch (...) {
        log::Registry::processor()->warn("[Context] isActive predicate failed for {}", key);
        return false;
    }
}

bool Context::tryClaim(const std::string& key) {
    std::scoped_lock lock(mutex);
    return processing.insert(key).second;
}

void Context::release(const std::string& key) {
    std::scoped_lock lock(mutex);
    processing.erase(key);
}

Store::SweepResult Context::sweep(const types::Clock::time_point now) {
    const auto cfg = config();
    Store::SweepResult result; {
        std::scoped_lock lock(mutex);
        result = store.sweep(now, cfg->ttl_file, cfg->ttl_directory, cfg->max_entries);
    }
    if (result.expired || result.evicted)
        log::Registry::cache()->debug("[Sweep] Expired {} entries, evicted {}", result.expired, result.evicted);
    return result;
}
