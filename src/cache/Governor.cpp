#include "cache/Governor.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fnmatch.h>

using namespace tt::cache;

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}

Governor::Governor(const config::CacheConfig& cfg, BusyPredicate hostBusy)
    : ignorePatterns_(cfg.ignore_patterns),
      maxFileSizeBytes_(cfg.max_file_size_bytes),
      maxConcurrentJobs_(cfg.max_concurrent_jobs),
      hostBusy_(std::move(hostBusy)) {
    for (const auto& ext : cfg.extensions) {
        auto e = toLower(ext);
        if (!e.empty() && e.front() == '.') e.erase(0, 1);
        if (!e.empty()) extensions_.insert(std::move(e));
    }
}

Governor::Verdict Governor::checkName(const std::string& path) const {
    if (path.empty()) return Verdict::EmptyPath;

    const fs::path p(path);
    const auto filename = p.filename().string();
    if (filename.empty() || filename.starts_with('.') || filename.ends_with(".lock") || filename.ends_with(".tmp"))
        return Verdict::SkippedName;

    const auto ext = p.extension().string();
    if (ext.size() < 2) return Verdict::NoExtension;
    if (!extensions_.contains(toLower(ext.substr(1)))) return Verdict::InvalidExtension;

    for (const auto& pattern : ignorePatterns_) {
        if (::fnmatch(pattern.c_str(), path.c_str(), 0) == 0 ||
            ::fnmatch(pattern.c_str(), filename.c_str(), 0) == 0)
            return Verdict::Ignored;
    }

    return Verdict::Eligible;
}

Governor::Verdict Governor::check(const std::string& path, const bool skipSizeCheck) const {
    if (const auto verdict = checkName(path); verdict != Verdict::Eligible) return verdict;

    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec || !fs::is_regular_file(st)) return Verdict::NotFile;

    if (!skipSizeCheck) {
        const auto size = fs::file_size(path, ec);
        if (ec) return Verdict::NotFile;
        if (size > maxFileSizeBytes_) return Verdict::Oversized;
    }

    return Verdict::Eligible;
}

std::size_t Governor::spareCapacity(const std::size_t inFlight) const {
    return inFlight >= maxConcurrentJobs_ ? 0 : maxConcurrentJobs_ - inFlight;
}

bool Governor::hostBusy() const {
    if (!hostBusy_) return false;
    try {
        return hostBusy_();
    } catch (const std::exception& e) {
        log::Registry::scheduler()->warn("[Governor] Host busy predicate failed: {}", e.what());
        return false;
    } catch (...) {
        log::Registry::scheduler()->warn("[Governor] Host busy predicate failed with an unknown error");
        return false;
    }
}

std::string tt::cache::to_string(const Governor::Verdict verdict) {
    switch (verdict) {
        case Governor::Verdict::Eligible: return "eligible";
        case Governor::Verdict::EmptyPath: return "empty_path";
        case Governor::Verdict::SkippedName: return "skip_file_type";
        case Governor::Verdict::NoExtension: return "no_extension";
        case Governor::Verdict::InvalidExtension: return "invalid_extension";
        case Governor::Verdict::Ignored: return "ignored";
        case Governor::Verdict::NotFile: return "not_file";
        case Governor::Verdict::Oversized: return "file_too_large";
    }
    return "unknown";
}
