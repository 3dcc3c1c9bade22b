#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace tt::counting {

/**
 * @brief The external computation a cache entry is derived from.
 *
 * Implementations may be slow and may fail; failures are reported by
 * throwing. The processor never trusts a counter to succeed and always
 * has a local estimate to fall back on.
 */
class Counter {
public:
    virtual ~Counter() = default;

    /**
     * @param content  full file contents
     * @param encoding tokenizer/encoding hint from the cache config
     * @return number of units in content
     */
    virtual uint64_t count(std::string_view content, const std::string& encoding) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// Adapts any callable; handy for hosts that already own a tokenizer object.
class FunctionCounter final : public Counter {
public:
    using Fn = std::function<uint64_t(std::string_view, const std::string&)>;

    explicit FunctionCounter(Fn fn, std::string name = "function");

    uint64_t count(std::string_view content, const std::string& encoding) override;
    [[nodiscard]] std::string name() const override { return name_; }

private:
    Fn fn_;
    std::string name_;
};

// Local heuristic used when no real tokenizer is wired in.
class HeuristicCounter final : public Counter {
public:
    uint64_t count(std::string_view content, const std::string& encoding) override;
    [[nodiscard]] std::string name() const override { return "heuristic"; }
};

// max(chars / 4, words * 1.3); 0 for empty input.
uint64_t estimate(std::string_view content);

// Estimate for a file of totalBytes from its first bytes. Accuracy is only as
// good as the sample is representative of the rest of the file.
uint64_t estimateFromSample(std::string_view sample, uint64_t totalBytes);

}
