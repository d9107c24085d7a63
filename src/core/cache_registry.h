#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cache_configuration.h"
#include "cache_settings.h"
#include "timer_queue.h"

/// One CacheConfiguration per cache file path, owned by the caller.
///
/// Entries are inserted on the first obtain() for a path and stay until
/// evict(). Evicting only drops the registry's reference: deleting the
/// cache file and its snapshot is up to the caller.
///
/// Configurations schedule their saves on the registry's TimerQueue. A
/// configuration kept past the registry still works; its saves are then
/// written immediately instead of debounced.
class CacheRegistry {
public:
    explicit CacheRegistry(const CacheSettings& settings = CacheSettings{});
    ~CacheRegistry();

    // Non-copyable
    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    /// Return the configuration for `cache_file_path`, loading it on first use.
    std::shared_ptr<CacheConfiguration> obtain(const std::string& cache_file_path);

    /// Return the configuration if already registered, nullptr otherwise.
    std::shared_ptr<CacheConfiguration> find(const std::string& cache_file_path) const;

    /// Drop the entry for `cache_file_path`. Returns false if not registered.
    bool evict(const std::string& cache_file_path);

    /// Write every registered configuration now. Returns the number of
    /// failed writes.
    int flushAll();

    /// Snapshot path for a cache file under this registry's settings.
    std::string snapshotPathFor(const std::string& cache_file_path) const;

    size_t size() const;
    std::vector<std::string> paths() const;

    const CacheSettings& settings() const { return settings_; }

private:
    CacheSettings settings_;
    std::shared_ptr<TimerQueue> timers_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CacheConfiguration>> entries_;
};
