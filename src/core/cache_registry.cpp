#include "cache_registry.h"
#include "logger.h"

// ── Constructor / destructor ───────────────────────────────────

CacheRegistry::CacheRegistry(const CacheSettings& settings)
    : settings_(settings)
    , timers_(std::make_shared<TimerQueue>())
{
    settings_.normalize();
}

CacheRegistry::~CacheRegistry()
{
    // Release entries before timers_ stops; armed saves become no-ops.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }
    timers_.reset();
}

// ── obtain / find / evict ──────────────────────────────────────

std::shared_ptr<CacheConfiguration> CacheRegistry::obtain(const std::string& cache_file_path)
{
    if (auto existing = find(cache_file_path)) {
        return existing;
    }

    // Disk read happens outside the lock. On a race the first insert wins
    // and the other load is dropped; load never writes, so nothing leaks.
    auto loaded = CacheConfiguration::load(cache_file_path, timers_, settings_);

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = entries_.emplace(cache_file_path, loaded);
    if (!inserted) {
        Logger::instance().debug("Concurrent load of " + cache_file_path + " discarded");
    }
    return it->second;
}

std::shared_ptr<CacheConfiguration> CacheRegistry::find(const std::string& cache_file_path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(cache_file_path);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

bool CacheRegistry::evict(const std::string& cache_file_path)
{
    std::shared_ptr<CacheConfiguration> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(cache_file_path);
        if (it == entries_.end()) {
            return false;
        }
        evicted = std::move(it->second);
        entries_.erase(it);
    }
    // Destroyed outside the lock if this was the last reference.
    Logger::instance().debug("Evicted cache configuration for " + cache_file_path);
    return true;
}

// ── flushAll ───────────────────────────────────────────────────

int CacheRegistry::flushAll()
{
    std::vector<std::shared_ptr<CacheConfiguration>> configs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        configs.reserve(entries_.size());
        for (const auto& [path, config] : entries_) {
            configs.push_back(config);
        }
    }

    int failures = 0;
    for (const auto& config : configs) {
        if (!config->flush()) {
            ++failures;
        }
    }
    return failures;
}

// ── Queries ────────────────────────────────────────────────────

std::string CacheRegistry::snapshotPathFor(const std::string& cache_file_path) const
{
    return CacheConfiguration::snapshotPathFor(cache_file_path, settings_.snapshot_extension);
}

size_t CacheRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> CacheRegistry::paths() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [path, config] : entries_) {
        result.push_back(path);
    }
    return result;
}
