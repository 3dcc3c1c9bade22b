// Cache
#include "cache/TokenCache.hpp"
#include "counting/Counter.hpp"

// Misc
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "types/Entry.hpp"
#include "types/stats/CacheStats.hpp"

// Libraries
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace tt::cache;
using namespace tt::config;
using namespace tt::log;
using namespace tt::types;

namespace {

struct Options {
    std::optional<std::string> configPath;
    std::string directory;
    bool recursive = false;
    bool json = false;
};

void usage(std::ostream& out) {
    out << "usage: tokentally [-c config.yaml] [-r] [--json] <dir>\n"
        << "  -c, --config   YAML config file (defaults apply when omitted)\n"
        << "  -r, --recursive  descend into subdirectories (dot-directories are skipped)\n"
        << "      --json     print entries and stats as JSON\n";
}

std::optional<Options> parseArgs(const int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") return std::nullopt;
        if (arg == "-r" || arg == "--recursive") opts.recursive = true;
        else if (arg == "--json") opts.json = true;
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) return std::nullopt;
            opts.configPath = argv[++i];
        } else if (!arg.empty() && arg.front() == '-') return std::nullopt;
        else if (opts.directory.empty()) opts.directory = arg;
        else return std::nullopt;
    }
    if (opts.directory.empty()) return std::nullopt;
    return opts;
}

}

int main(const int argc, char** argv) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        usage(std::cerr);
        return 2;
    }

    try {
        const auto cfg = opts->configPath ? loadConfig(*opts->configPath) : Config{};
        Registry::init(cfg.logging);

        TokenCache cache(cfg.cache, std::make_shared<tt::counting::HeuristicCounter>());
        cache.subscribe([](const std::string& key, const EntryKind kind) {
            Registry::notify()->debug("[tokentally] Updated {} ({})", key, to_string(kind));
        });
        cache.start();

        const auto root = TokenCache::normalizeKey(opts->directory);
        Registry::tokentally()->info("[*] Counting {}{}", root, opts->recursive ? " recursively" : "");

        const auto result = cache.computeDirectory(root, opts->recursive).get();
        if (!result.ok()) {
            Registry::tokentally()->error("[-] Failed to count {}: {}", root, result.error);
            return EXIT_FAILURE;
        }

        std::vector<CacheEntry> files; {
            auto& ctx = cache.context();
            std::scoped_lock lock(ctx.mutex);
            for (auto& entry : ctx.store.snapshot())
                if (entry.kind == EntryKind::File) files.push_back(std::move(entry));
        }
        std::ranges::sort(files, {}, &CacheEntry::key);

        const auto stats = cache.stats();
        cache.stop();

        if (opts->json) {
            nlohmann::json out;
            out["directory"] = root;
            out["total"] = result.sum;
            out["files"] = files;
            out["stats"] = stats;
            std::cout << out.dump(2) << std::endl;
        } else {
            for (const auto& entry : files) std::cout << fmt::format("{:>8}  {}\n", entry.displayText, entry.key);
            std::cout << fmt::format("{:>8}  {} ({} files, {} from cache, {} skipped)\n",
                                     formatDisplay(result.sum, EntryStatus::Ready), root,
                                     result.counted, result.reused, result.skipped);
        }

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Registry::tokentally()->error("[-] tokentally failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
