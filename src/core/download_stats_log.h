// download_stats_log.h
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

struct DownloadSample {
    int64_t bytes = 0;      // bytes transferred
    double seconds = 0.0;   // time spent transferring them

    bool operator==(const DownloadSample& other) const {
        return bytes == other.bytes && seconds == other.seconds;
    }
};

/// Append-only history of download throughput samples.
/// Unbounded; callers that need a cap truncate externally.
class DownloadStatsLog {
public:
    using Snapshot = std::shared_ptr<const std::vector<DownloadSample>>;

    DownloadStatsLog();

    DownloadStatsLog(const DownloadStatsLog&) = delete;
    DownloadStatsLog& operator=(const DownloadStatsLog&) = delete;

    // Append a sample (thread-safe)
    void addSample(int64_t bytes, double seconds);

    // Replace the whole history (used when restoring a snapshot)
    void assign(std::vector<DownloadSample> samples);

    // Immutable snapshot in insertion order
    Snapshot samples() const;

    int64_t totalBytes() const;
    double totalSeconds() const;

    // Bytes per second over the whole history, 0 when no time recorded
    double averageSpeed() const;

private:
    mutable std::mutex mutex_;
    Snapshot samples_;
};
