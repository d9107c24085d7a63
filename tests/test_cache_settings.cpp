#include <gtest/gtest.h>
#include "cache_settings.h"
#include "logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ── Defaults ───────────────────────────────────────────────────

TEST(CacheSettingsTest, Defaults) {
    CacheSettings s;
    EXPECT_EQ(s.save_window_ms, 2000);
    EXPECT_EQ(s.snapshot_extension, "cache_configuration");
    EXPECT_TRUE(s.log_file.empty());
    EXPECT_EQ(s.log_level, "info");
}

// ── JSON parsing ───────────────────────────────────────────────

TEST(CacheSettingsTest, ParsesAllKeys) {
    auto s = CacheSettings::fromJson(R"({
        "save_window_ms": 500,
        "snapshot_extension": "frag",
        "log_file": "/tmp/cache.log",
        "log_level": "debug"
    })");
    EXPECT_EQ(s.save_window_ms, 500);
    EXPECT_EQ(s.snapshot_extension, "frag");
    EXPECT_EQ(s.log_file, "/tmp/cache.log");
    EXPECT_EQ(s.log_level, "debug");
}

TEST(CacheSettingsTest, MissingKeysKeepDefaults) {
    auto s = CacheSettings::fromJson(R"({"save_window_ms": 750})");
    EXPECT_EQ(s.save_window_ms, 750);
    EXPECT_EQ(s.snapshot_extension, "cache_configuration");
}

TEST(CacheSettingsTest, OutOfRangeWindowIsClamped) {
    EXPECT_EQ(CacheSettings::fromJson(R"({"save_window_ms": 1})").save_window_ms,
              CacheSettings::kMinSaveWindowMs);
    EXPECT_EQ(CacheSettings::fromJson(R"({"save_window_ms": 999999})").save_window_ms,
              CacheSettings::kMaxSaveWindowMs);
}

TEST(CacheSettingsTest, WindowBeyondIntRangeIsClampedNotWrapped) {
    // 2^32 + 100 would wrap to 100 through a plain int conversion.
    EXPECT_EQ(CacheSettings::fromJson(R"({"save_window_ms": 4294967396})").save_window_ms,
              CacheSettings::kMaxSaveWindowMs);
    EXPECT_EQ(CacheSettings::fromJson(R"({"save_window_ms": 18446744073709551615})").save_window_ms,
              CacheSettings::kMaxSaveWindowMs);
    EXPECT_EQ(CacheSettings::fromJson(R"({"save_window_ms": -4294967196})").save_window_ms,
              CacheSettings::kMinSaveWindowMs);

    auto logs = Logger::instance().getRecentLogs(1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_NE(logs[0].find("clamped"), std::string::npos);
}

TEST(CacheSettingsTest, FractionalWindowIsIgnored) {
    EXPECT_EQ(CacheSettings::fromJson(R"({"save_window_ms": 500.5})").save_window_ms, 2000);
}

TEST(CacheSettingsTest, WrongTypesAreIgnored) {
    auto s = CacheSettings::fromJson(R"({"save_window_ms": "fast", "snapshot_extension": 3})");
    EXPECT_EQ(s.save_window_ms, 2000);
    EXPECT_EQ(s.snapshot_extension, "cache_configuration");
}

TEST(CacheSettingsTest, ExtensionLeadingDotsStripped) {
    auto s = CacheSettings::fromJson(R"({"snapshot_extension": "..cfg"})");
    EXPECT_EQ(s.snapshot_extension, "cfg");

    s = CacheSettings::fromJson(R"({"snapshot_extension": ""})");
    EXPECT_EQ(s.snapshot_extension, "cache_configuration");
}

TEST(CacheSettingsTest, MalformedJsonYieldsDefaults) {
    auto s = CacheSettings::fromJson("{ not json");
    EXPECT_EQ(s.save_window_ms, 2000);

    s = CacheSettings::fromJson("[1, 2, 3]");
    EXPECT_EQ(s.save_window_ms, 2000);
}

// ── File loading ───────────────────────────────────────────────

TEST(CacheSettingsTest, FromFile) {
    std::string path = (fs::temp_directory_path() / "cache_settings_test.json").string();
    {
        std::ofstream ofs(path);
        ofs << R"({"save_window_ms": 300, "log_level": "warn"})";
    }
    auto s = CacheSettings::fromFile(path);
    EXPECT_EQ(s.save_window_ms, 300);
    EXPECT_EQ(s.log_level, "warn");
    std::remove(path.c_str());
}

TEST(CacheSettingsTest, MissingFileYieldsDefaults) {
    auto s = CacheSettings::fromFile("does_not_exist_12345.json");
    EXPECT_EQ(s.save_window_ms, 2000);
}

TEST(CacheSettingsTest, ApplyLoggingSetsLevel) {
    CacheSettings s;
    s.log_level = "error";
    s.applyLogging();
    EXPECT_EQ(Logger::instance().minLevel(), LogLevel::LVL_ERROR);

    s.log_level = "info";
    s.applyLogging();
    EXPECT_EQ(Logger::instance().minLevel(), LogLevel::LVL_INFO);
}
