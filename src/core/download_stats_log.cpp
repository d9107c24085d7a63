// download_stats_log.cpp
#include "download_stats_log.h"

DownloadStatsLog::DownloadStatsLog()
    : samples_(std::make_shared<const std::vector<DownloadSample>>())
{
}

void DownloadStatsLog::addSample(int64_t bytes, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = std::atomic_load(&samples_);

    auto next = std::make_shared<std::vector<DownloadSample>>();
    next->reserve(current->size() + 1);
    next->assign(current->begin(), current->end());
    next->push_back(DownloadSample{bytes, seconds});

    std::atomic_store(&samples_, Snapshot(std::move(next)));
}

void DownloadStatsLog::assign(std::vector<DownloadSample> samples) {
    auto next = std::make_shared<const std::vector<DownloadSample>>(std::move(samples));
    std::lock_guard<std::mutex> lock(mutex_);
    std::atomic_store(&samples_, Snapshot(std::move(next)));
}

DownloadStatsLog::Snapshot DownloadStatsLog::samples() const {
    return std::atomic_load(&samples_);
}

int64_t DownloadStatsLog::totalBytes() const {
    auto snapshot = samples();
    int64_t total = 0;
    for (const auto& s : *snapshot) {
        total += s.bytes;
    }
    return total;
}

double DownloadStatsLog::totalSeconds() const {
    auto snapshot = samples();
    double total = 0.0;
    for (const auto& s : *snapshot) {
        total += s.seconds;
    }
    return total;
}

double DownloadStatsLog::averageSpeed() const {
    auto snapshot = samples();
    int64_t bytes = 0;
    double seconds = 0.0;
    for (const auto& s : *snapshot) {
        bytes += s.bytes;
        seconds += s.seconds;
    }
    if (seconds <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes) / seconds;
}
