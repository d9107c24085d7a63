// cache_inspect: print the cached state recorded for one or more cache files.
#include "core/cache_registry.h"
#include "core/cache_settings.h"
#include "core/logger.h"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--settings FILE] [--verbose] CACHE_FILE...\n"
              << "Prints fragments, throughput samples and metadata stored in\n"
              << "each CACHE_FILE's snapshot.\n";
}

static void printConfiguration(const CacheConfiguration& config) {
    std::cout << "cache file:    " << config.cacheFilePath() << "\n"
              << "snapshot:      " << config.filePath() << "\n"
              << "file name:     " << config.fileName() << "\n"
              << "url:           " << (config.url().empty() ? "(unknown)" : config.url()) << "\n";

    if (auto info = config.contentInfo()) {
        std::cout << "content type:  " << info->content_type << "\n"
                  << "length:        " << info->content_length << "\n"
                  << "range access:  " << (info->byte_range_access_supported ? "yes" : "no") << "\n";
    } else {
        std::cout << "content info:  (none)\n";
    }

    auto fragments = config.fragments();
    std::cout << "fragments:     " << fragments->size() << "\n";
    for (const auto& f : *fragments) {
        std::cout << "  [" << f.offset << ", " << f.end() << ")  " << f.length << " bytes\n";
    }
    std::cout << "cached bytes:  " << config.downloadedBytes() << "\n"
              << "progress:      " << std::fixed << std::setprecision(1)
              << config.progress() * 100.0 << "%\n";

    auto samples = config.downloadInfo();
    std::cout << "samples:       " << samples->size() << "\n"
              << "avg speed:     " << std::setprecision(0) << config.downloadSpeed() << " B/s\n\n";
}

int main(int argc, char* argv[])
{
    std::string settings_path;
    bool verbose = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--settings") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            settings_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    CacheSettings settings;
    if (!settings_path.empty()) {
        settings = CacheSettings::fromFile(settings_path);
    }
    if (verbose) {
        settings.log_level = "debug";
    }
    settings.applyLogging();

    CacheRegistry registry(settings);
    for (const auto& file : files) {
        auto config = registry.obtain(file);
        printConfiguration(*config);
    }

    if (verbose) {
        for (const auto& line : Logger::instance().getRecentLogs()) {
            std::cerr << line << "\n";
        }
    }
    return 0;
}
