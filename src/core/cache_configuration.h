#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "cache_settings.h"
#include "content_info.h"
#include "download_stats_log.h"
#include "fragment_index.h"
#include "save_debouncer.h"
#include "snapshot_codec.h"

class TimerQueue;

/// Cache state of one media resource: which byte ranges are on disk,
/// throughput history and resource metadata, bound to a snapshot file next
/// to the cache file.
///
/// Always handled through shared_ptr (see load()); debounced saves keep
/// only a weak reference to it.
class CacheConfiguration {
public:
    /// The one rule mapping a cache file to its snapshot file:
    /// "<cache_file_path>.<extension>".
    static std::string snapshotPathFor(const std::string& cache_file_path,
                                       const std::string& extension = "cache_configuration");

    /// Load the configuration for `cache_file_path`, or create a fresh one
    /// when no snapshot exists or it cannot be decoded. Never writes.
    ///
    /// @param timers   Context that runs the debounce timers. Only a weak
    ///                 reference is kept; without it saves write through.
    /// @throws std::invalid_argument if `timers` is null.
    static std::shared_ptr<CacheConfiguration> load(const std::string& cache_file_path,
                                                    const std::shared_ptr<TimerQueue>& timers,
                                                    const CacheSettings& settings = CacheSettings{});

    CacheConfiguration(const CacheConfiguration&) = delete;
    CacheConfiguration& operator=(const CacheConfiguration&) = delete;

    // ── Mutation ──────────────────────────────────────────────

    /// Record that [offset, offset + length) is now available locally.
    /// Invalid ranges are ignored.
    void addFragment(int64_t offset, int64_t length);

    /// Record a throughput sample.
    void addDownloadedBytes(int64_t bytes, double seconds);

    void setUrl(const std::string& url);
    void setContentInfo(const ContentInfo& info);

    // ── Persistence ───────────────────────────────────────────

    /// Debounced save (see SaveDebouncer).
    void save();

    /// Write the snapshot now, bypassing the debounce window.
    /// Returns false (and logs) on failure.
    bool flush();

    int pendingSaveCount() const;

    // ── Accessors ─────────────────────────────────────────────

    FragmentIndex::Snapshot fragments() const;
    DownloadStatsLog::Snapshot downloadInfo() const;
    const FragmentIndex& fragmentIndex() const { return fragments_; }

    std::string fileName() const;
    std::string url() const;
    std::optional<ContentInfo> contentInfo() const;

    /// Snapshot file this configuration is bound to. Not persisted.
    const std::string& filePath() const { return file_path_; }

    /// Cache file the snapshot describes.
    const std::string& cacheFilePath() const { return cache_file_path_; }

    /// Bytes covered by the fragment index.
    int64_t downloadedBytes() const;

    /// downloadedBytes / content length in [0, 1]; 0 when the length is unknown.
    double progress() const;

    /// Average throughput in bytes per second over all samples.
    double downloadSpeed() const;

    /// Value copy of the persisted fields.
    SnapshotData toSnapshot() const;

private:
    CacheConfiguration(std::string cache_file_path, std::string file_path);

    void restore(const SnapshotData& data);
    bool writeSnapshot();

    const std::string cache_file_path_;
    const std::string file_path_;

    FragmentIndex fragments_;
    DownloadStatsLog download_info_;

    mutable std::mutex metadata_mutex_;  // file_name_, url_, content_info_
    std::string file_name_;
    std::string url_;
    std::optional<ContentInfo> content_info_;

    std::mutex write_mutex_;             // one snapshot write at a time
    std::unique_ptr<SaveDebouncer> debouncer_;
};
