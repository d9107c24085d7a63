#include "cache_configuration.h"
#include "logger.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

// ── Construction / load ────────────────────────────────────────

CacheConfiguration::CacheConfiguration(std::string cache_file_path, std::string file_path)
    : cache_file_path_(std::move(cache_file_path))
    , file_path_(std::move(file_path))
{
}

std::string CacheConfiguration::snapshotPathFor(const std::string& cache_file_path,
                                                const std::string& extension) {
    return cache_file_path + "." + extension;
}

std::shared_ptr<CacheConfiguration> CacheConfiguration::load(const std::string& cache_file_path,
                                                             const std::shared_ptr<TimerQueue>& timers,
                                                             const CacheSettings& settings) {
    std::string snapshot_path = snapshotPathFor(cache_file_path, settings.snapshot_extension);
    std::shared_ptr<CacheConfiguration> config(
        new CacheConfiguration(cache_file_path, snapshot_path));

    bool restored = false;
    std::error_code ec;
    if (fs::exists(snapshot_path, ec)) {
        std::string error;
        std::optional<SnapshotData> data;
        auto bytes = SnapshotCodec::readFile(snapshot_path, &error);
        if (bytes) {
            data = SnapshotCodec::decode(*bytes, &error);
        }
        if (data) {
            config->restore(*data);
            restored = true;
            Logger::instance().debug("Loaded cache configuration " + snapshot_path
                                     + " (" + std::to_string(config->fragments_.size())
                                     + " fragments)");
        } else {
            Logger::instance().warn("Error loading cache configuration " + snapshot_path
                                    + ": " + error + "; starting fresh");
        }
    } else {
        Logger::instance().debug("No cache configuration at " + snapshot_path);
    }

    if (!restored) {
        config->file_name_ = fs::path(cache_file_path).filename().string();
    }

    std::weak_ptr<CacheConfiguration> weak_config = config;
    config->debouncer_ = std::make_unique<SaveDebouncer>(
        timers,
        std::chrono::milliseconds(settings.save_window_ms),
        [weak_config] {
            if (auto self = weak_config.lock()) {
                self->writeSnapshot();
            }
        });

    return config;
}

void CacheConfiguration::restore(const SnapshotData& data) {
    fragments_.assign(data.fragments);
    download_info_.assign(data.download_info);

    std::lock_guard<std::mutex> lock(metadata_mutex_);
    file_name_ = data.file_name;
    url_ = data.url;
    content_info_ = data.content_info;
}

// ── Mutation ───────────────────────────────────────────────────

void CacheConfiguration::addFragment(int64_t offset, int64_t length) {
    fragments_.addFragment(offset, length);
}

void CacheConfiguration::addDownloadedBytes(int64_t bytes, double seconds) {
    download_info_.addSample(bytes, seconds);
}

void CacheConfiguration::setUrl(const std::string& url) {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    url_ = url;
}

void CacheConfiguration::setContentInfo(const ContentInfo& info) {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    content_info_ = info;
}

// ── Persistence ────────────────────────────────────────────────

void CacheConfiguration::save() {
    debouncer_->requestSave();
}

bool CacheConfiguration::flush() {
    return writeSnapshot();
}

int CacheConfiguration::pendingSaveCount() const {
    return debouncer_->pendingCount();
}

bool CacheConfiguration::writeSnapshot() {
    std::lock_guard<std::mutex> lock(write_mutex_);

    std::string error;
    auto bytes = SnapshotCodec::encode(toSnapshot(), &error);
    if (!bytes) {
        Logger::instance().error("Cannot encode cache configuration " + file_path_ + ": " + error);
        return false;
    }
    if (!SnapshotCodec::writeFile(file_path_, *bytes, &error)) {
        Logger::instance().error("Cannot write cache configuration: " + error);
        return false;
    }
    return true;
}

// ── Accessors ──────────────────────────────────────────────────

FragmentIndex::Snapshot CacheConfiguration::fragments() const {
    return fragments_.fragments();
}

DownloadStatsLog::Snapshot CacheConfiguration::downloadInfo() const {
    return download_info_.samples();
}

std::string CacheConfiguration::fileName() const {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    return file_name_;
}

std::string CacheConfiguration::url() const {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    return url_;
}

std::optional<ContentInfo> CacheConfiguration::contentInfo() const {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    return content_info_;
}

int64_t CacheConfiguration::downloadedBytes() const {
    return fragments_.cachedBytes();
}

double CacheConfiguration::progress() const {
    int64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(metadata_mutex_);
        if (content_info_) {
            total = content_info_->content_length;
        }
    }
    if (total <= 0) {
        return 0.0;
    }
    double ratio = static_cast<double>(downloadedBytes()) / static_cast<double>(total);
    return std::min(ratio, 1.0);
}

double CacheConfiguration::downloadSpeed() const {
    return download_info_.averageSpeed();
}

SnapshotData CacheConfiguration::toSnapshot() const {
    SnapshotData data;
    data.fragments = *fragments_.fragments();
    data.download_info = *download_info_.samples();

    std::lock_guard<std::mutex> lock(metadata_mutex_);
    data.file_name = file_name_;
    data.url = url_;
    data.content_info = content_info_;
    return data;
}
