#include "cache_settings.h"
#include "logger.h"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace {

template <typename T>
void readKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        Logger::instance().warn(std::string("Settings: ignoring invalid value for '") + key + "'");
    }
}

// Integers are range-checked here and clamped by normalize(); get<int>()
// would silently wrap values outside int.
void readKey(const json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer()) {
        Logger::instance().warn(std::string("Settings: ignoring non-integer value for '") + key + "'");
        return;
    }
    constexpr auto kMax = std::numeric_limits<int>::max();
    constexpr auto kMin = std::numeric_limits<int>::min();
    if (it->is_number_unsigned()) {
        auto v = it->get<uint64_t>();
        out = v > static_cast<uint64_t>(kMax) ? kMax : static_cast<int>(v);
    } else {
        auto v = it->get<int64_t>();
        out = static_cast<int>(std::clamp<int64_t>(v, kMin, kMax));
    }
}

} // namespace

CacheSettings CacheSettings::fromJson(const std::string& text) {
    CacheSettings settings;
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        Logger::instance().warn("Settings: not a JSON object, using defaults");
        return settings;
    }

    readKey(j, "save_window_ms",     settings.save_window_ms);
    readKey(j, "snapshot_extension", settings.snapshot_extension);
    readKey(j, "log_file",           settings.log_file);
    readKey(j, "log_level",          settings.log_level);

    settings.normalize();
    return settings;
}

CacheSettings CacheSettings::fromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        Logger::instance().debug("Settings: " + path + " not found, using defaults");
        return CacheSettings{};
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return fromJson(ss.str());
}

void CacheSettings::normalize() {
    int clamped = std::clamp(save_window_ms, kMinSaveWindowMs, kMaxSaveWindowMs);
    if (clamped != save_window_ms) {
        Logger::instance().warn("Settings: save_window_ms " + std::to_string(save_window_ms)
                                + " clamped to " + std::to_string(clamped));
        save_window_ms = clamped;
    }

    // Leading dots would produce "file..ext".
    while (!snapshot_extension.empty() && snapshot_extension.front() == '.') {
        snapshot_extension.erase(snapshot_extension.begin());
    }
    if (snapshot_extension.empty()) {
        snapshot_extension = "cache_configuration";
    }
}

void CacheSettings::applyLogging() const {
    Logger::instance().setMinLevel(Logger::levelFromString(log_level));
    Logger::instance().setLogFile(log_file);
}
