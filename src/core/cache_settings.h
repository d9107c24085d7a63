#pragma once

#include <string>

struct CacheSettings {
    int save_window_ms = 2000;                             // debounce window
    std::string snapshot_extension = "cache_configuration"; // appended as "<path>.<ext>"
    std::string log_file;                                  // empty = no file
    std::string log_level = "info";

    static constexpr int kMinSaveWindowMs = 10;
    static constexpr int kMaxSaveWindowMs = 60000;

    /// Parse settings from a JSON document. Missing keys keep their
    /// defaults, out-of-range values are clamped. Malformed JSON or
    /// wrongly typed values yield defaults for the affected keys.
    static CacheSettings fromJson(const std::string& text);

    /// Load settings from a JSON file. A missing or unreadable file
    /// yields defaults.
    static CacheSettings fromFile(const std::string& path);

    /// Clamp values to their valid ranges and fill empty required fields.
    void normalize();

    /// Apply log_file / log_level to the Logger singleton.
    void applyLogging() const;
};
