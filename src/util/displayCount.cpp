#include "util/displayCount.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

namespace tt::util {

std::string formatCount(const uint64_t count) {
    if (count < 1'000) return std::to_string(count);
    if (count < 10'000) {
        const auto tenths = count / 100;
        return fmt::format("{}.{}k", tenths / 10, tenths % 10);
    }
    if (count < 1'000'000) return fmt::format("{}k", count / 1'000);
    if (count < 10'000'000) {
        const auto tenths = count / 100'000;
        return fmt::format("{}.{}M", tenths / 10, tenths % 10);
    }
    return fmt::format("{}M", count / 1'000'000);
}

std::optional<uint64_t> parseDisplay(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    while (!text.empty() && (text.back() == ESTIMATE_MARKER || text.back() == OVERSIZED_MARKER)) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    if (text == LARGE_TEXT || text == "HUGE") return LARGE_SENTINEL;

    double multiplier = 1.0;
    switch (text.back()) {
        case 'k':
        case 'K':
            multiplier = 1'000.0;
            text.remove_suffix(1);
            break;
        case 'M':
        case 'm':
            multiplier = 1'000'000.0;
            text.remove_suffix(1);
            break;
        default:
            break;
    }
    if (text.empty()) return std::nullopt;

    const std::string digits(text);
    char* end = nullptr;
    const double number = std::strtod(digits.c_str(), &end);
    if (end != digits.c_str() + digits.size() || !std::isfinite(number) || number < 0.0) return std::nullopt;

    const double scaled = number * multiplier;
    // 2^63; llround is unspecified at and beyond it.
    if (!std::isfinite(scaled) || scaled >= 9223372036854775808.0) return std::nullopt;

    return static_cast<uint64_t>(std::llround(scaled));
}

}
