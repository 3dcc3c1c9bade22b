#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tt::util {

constexpr char ESTIMATE_MARKER = '~';
constexpr char OVERSIZED_MARKER = '*';

// Shown for an oversized entry whose sample could not be read.
constexpr std::string_view LARGE_TEXT = "LARGE";

// Numeric stand-in for LARGE (and the legacy HUGE) when summing displayed text.
constexpr uint64_t LARGE_SENTINEL = 1'000'000;

// 999 -> "999", 1234 -> "1.2k", 12345 -> "12k", 2500000 -> "2.5M", 12000000 -> "12M".
// Digits past the shown precision are truncated, never rounded up.
std::string formatCount(uint64_t count);

// Inverse of formatCount() for callers that only hold display text. Markers are
// ignored, LARGE/HUGE yield LARGE_SENTINEL, anything else unparsable yields nullopt.
std::optional<uint64_t> parseDisplay(std::string_view text);

}
