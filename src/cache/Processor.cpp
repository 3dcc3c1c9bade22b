#include "cache/Processor.hpp"
#include "concurrency/ProcessTask.hpp"
#include "notify/NotificationBatcher.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <fmt/format.h>

using namespace tt::cache;
using namespace tt::types;
using namespace tt::config;
using Verdict = Governor::Verdict;

namespace fs = std::filesystem;

namespace {

constexpr std::size_t READ_CHUNK = 64 * 1024;

std::future<ProcessResult> readyResult(ProcessResult result) {
    std::promise<ProcessResult> p;
    p.set_value(std::move(result));
    return p.get_future();
}

// Reads up to `limit` bytes (all of it when empty). Throws on open/read errors.
std::string readContent(const std::string& path, const std::optional<uintmax_t> limit) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error(fmt::format("cannot open '{}'", path));

    std::string content;
    std::array<char, READ_CHUNK> buf{};
    while (in && (!limit || content.size() < *limit)) {
        auto want = static_cast<uintmax_t>(buf.size());
        if (limit) want = std::min(want, *limit - content.size());
        in.read(buf.data(), static_cast<std::streamsize>(want));
        content.append(buf.data(), static_cast<std::size_t>(in.gcount()));
    }

    if (in.bad()) throw std::runtime_error(fmt::format("read error on '{}'", path));
    return content;
}

uint64_t elapsedUs(const Clock::time_point since) {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - since).count());
}

}

std::string tt::cache::to_string(const ProcessResult::Outcome outcome) {
    switch (outcome) {
        case ProcessResult::Outcome::Updated: return "updated";
        case ProcessResult::Outcome::AlreadyProcessing: return "already_processing";
        case ProcessResult::Outcome::Ineligible: return "ineligible";
        case ProcessResult::Outcome::ReadFailed: return "read_failed";
        case ProcessResult::Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

Processor::Processor(Context& ctx, std::shared_ptr<counting::Counter> counter,
                     notify::NotificationBatcher& batcher, const unsigned int workerThreads)
    : ctx_(ctx), counter_(std::move(counter)), batcher_(batcher), pool_("processor", workerThreads) {
    if (!counter_) throw std::invalid_argument("Processor requires a counter");
}

Processor::~Processor() {
    stop();
}

void Processor::stop() {
    pool_.stop();
}

std::future<ProcessResult> Processor::process(const std::string& key) {
    if (!ctx_.tryClaim(key)) {
        log::Registry::processor()->debug("[Processor] {} is already processing", key);
        return readyResult({ProcessResult::Outcome::AlreadyProcessing, std::nullopt, {}});
    }

    auto mode = ReadMode::Bounded;
    auto verdict = ctx_.governor()->check(key);
    if (verdict == Verdict::Oversized) {
        mode = ctx_.isActive(key) ? ReadMode::Unbounded : ReadMode::Sample;
        verdict = Verdict::Eligible;
    }

    if (verdict != Verdict::Eligible) {
        ctx_.release(key);
        log::Registry::processor()->debug("[Processor] Skipping {}: {}", key, to_string(verdict));
        return readyResult({ProcessResult::Outcome::Ineligible, std::nullopt, to_string(verdict)});
    }

    const auto task = std::make_shared<concurrency::ProcessTask>(*this, key, mode);
    auto future = task->getFuture();
    if (!pool_.submit(task)) task->cancel();
    return future;
}

ProcessResult Processor::run(const std::string& key, const ReadMode mode) {
    const auto started = Clock::now();
    const auto cfg = ctx_.config();

    ProcessResult result;
    try {
        auto entry = mode == ReadMode::Sample ? sampleEntry(key, *cfg) : countEntry(key, mode, *cfg); {
            std::scoped_lock lock(ctx_.mutex);
            ctx_.store.put(entry);
            ctx_.processing.erase(key);
        }
        result.entry = std::move(entry);
    } catch (const std::exception& e) {
        ctx_.release(key);
        ctx_.stats.record_read_failure();
        log::Registry::processor()->warn("[Processor] Failed to process {}: {}", key, e.what());
        return {ProcessResult::Outcome::ReadFailed, std::nullopt, e.what()};
    } catch (...) {
        ctx_.release(key);
        ctx_.stats.record_read_failure();
        log::Registry::processor()->warn("[Processor] Failed to process {}: unknown error", key);
        return {ProcessResult::Outcome::ReadFailed, std::nullopt, "unknown error"};
    }

    ctx_.stats.record_processed();
    ctx_.stats.record_op_us(elapsedUs(started));
    batcher_.notifyUpdated(key, EntryKind::File);
    return result;
}

ProcessResult Processor::abandon(const std::string& key) {
    ctx_.release(key);
    log::Registry::processor()->debug("[Processor] Dropped pending run for {}", key);
    return {ProcessResult::Outcome::Cancelled, std::nullopt, "processor stopped"};
}

CacheEntry Processor::countEntry(const std::string& key, const ReadMode mode, const CacheConfig& cfg) {
    std::optional<uintmax_t> limit = cfg.max_file_size_bytes;
    if (mode == ReadMode::Unbounded) {
        limit.reset();
        std::error_code ec;
        if (const auto size = fs::file_size(key, ec); !ec && size > LARGE_ACTIVE_FILE_WARN_BYTES)
            log::Registry::processor()->warn("[Processor] Counting very large active file {} ({} bytes)", key, size);
    }

    const auto content = readContent(key, limit);
    if (content.empty()) return CacheEntry::make(key, EntryKind::File, EntryStatus::Ready, 0, Clock::now());

    try {
        const auto value = counter_->count(content, cfg.encoding);
        return CacheEntry::make(key, EntryKind::File, EntryStatus::Ready, value, Clock::now());
    } catch (const std::exception& e) {
        ctx_.stats.record_estimated();
        log::Registry::processor()->warn("[Processor] Counter '{}' failed for {}, using estimate: {}",
                                         counter_->name(), key, e.what());
        return CacheEntry::make(key, EntryKind::File, EntryStatus::Estimated,
                                counting::estimate(content), Clock::now());
    } catch (...) {
        ctx_.stats.record_estimated();
        log::Registry::processor()->warn("[Processor] Counter '{}' failed for {}, using estimate: unknown error",
                                         counter_->name(), key);
        return CacheEntry::make(key, EntryKind::File, EntryStatus::Estimated,
                                counting::estimate(content), Clock::now());
    }
}

CacheEntry Processor::sampleEntry(const std::string& key, const CacheConfig& cfg) {
    ctx_.stats.record_oversized();

    std::optional<uint64_t> value;
    try {
        const auto size = fs::file_size(key);
        const auto sample = readContent(key, cfg.sample_bytes);
        value = counting::estimateFromSample(sample, size);
        log::Registry::processor()->info("[Processor] {} exceeds {} bytes, estimated from a {} byte sample",
                                         key, cfg.max_file_size_bytes, sample.size());
    } catch (const std::exception& e) {
        log::Registry::processor()->info("[Processor] {} exceeds {} bytes and could not be sampled: {}",
                                         key, cfg.max_file_size_bytes, e.what());
    }

    return CacheEntry::make(key, EntryKind::File, EntryStatus::Oversized, value, Clock::now());
}
