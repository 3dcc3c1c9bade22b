#pragma once

#include "cache/Context.hpp"
#include "concurrency/ThreadPool.hpp"
#include "counting/Counter.hpp"
#include "types/Entry.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>

namespace tt::notify { class NotificationBatcher; }

namespace tt::cache {

struct ProcessResult {
    enum class Outcome {
        Updated,            // store holds a fresh entry for the key
        AlreadyProcessing,  // another run owns the key; nothing done
        Ineligible,         // rejected by the governor; error names the verdict
        ReadFailed,         // store untouched; error carries the cause
        Cancelled           // pool shut down before the run started
    };

    Outcome outcome = Outcome::Updated;
    std::optional<types::CacheEntry> entry;
    std::string error;

    [[nodiscard]] bool ok() const { return outcome == Outcome::Updated; }
};

std::string to_string(ProcessResult::Outcome outcome);

/**
 * @brief Computes one file's count and writes it to the store.
 *
 * process() claims the key and consults the governor on the caller's
 * thread, then hands the read/count/write steps to a worker. The key stays
 * in the processing set from the claim until the entry is written (or the
 * run fails), so one key never has two runs in flight.
 */
class Processor {
public:
    enum class ReadMode {
        Bounded,    // read at most max_file_size_bytes
        Unbounded,  // active file, size ceiling lifted
        Sample      // oversized: estimate from the first sample_bytes
    };

    Processor(Context& ctx, std::shared_ptr<counting::Counter> counter,
              notify::NotificationBatcher& batcher, unsigned int workerThreads);

    ~Processor();

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    std::future<ProcessResult> process(const std::string& key);

    // Pending runs are cancelled; running ones finish first.
    void stop();

    // Worker side of process(); expects the key to be claimed already.
    ProcessResult run(const std::string& key, ReadMode mode);

    // Releases a claimed key whose run never started.
    ProcessResult abandon(const std::string& key);

private:
    types::CacheEntry countEntry(const std::string& key, ReadMode mode, const config::CacheConfig& cfg);
    types::CacheEntry sampleEntry(const std::string& key, const config::CacheConfig& cfg);

    Context& ctx_;
    std::shared_ptr<counting::Counter> counter_;
    notify::NotificationBatcher& batcher_;
    concurrency::ThreadPool pool_;
};

}
