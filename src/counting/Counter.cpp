#include "counting/Counter.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace tt::counting;

FunctionCounter::FunctionCounter(Fn fn, std::string name)
    : fn_(std::move(fn)), name_(std::move(name)) {
    if (!fn_) throw std::invalid_argument("FunctionCounter requires a callable");
}

uint64_t FunctionCounter::count(const std::string_view content, const std::string& encoding) {
    return fn_(content, encoding);
}

uint64_t HeuristicCounter::count(const std::string_view content, const std::string&) {
    return estimate(content);
}

uint64_t tt::counting::estimate(const std::string_view content) {
    if (content.empty()) return 0;

    const uint64_t charEstimate = content.size() / 4;

    uint64_t words = 0;
    bool inWord = false;
    for (const char c : content) {
        if (std::isspace(static_cast<unsigned char>(c))) inWord = false;
        else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    const auto wordEstimate = static_cast<uint64_t>(static_cast<double>(words) * 1.3);

    return std::max(charEstimate, wordEstimate);
}

uint64_t tt::counting::estimateFromSample(const std::string_view sample, const uint64_t totalBytes) {
    if (sample.empty() || totalBytes == 0) return 0;
    const double scale = static_cast<double>(totalBytes) / static_cast<double>(sample.size());
    return static_cast<uint64_t>(static_cast<double>(estimate(sample)) * scale);
}
