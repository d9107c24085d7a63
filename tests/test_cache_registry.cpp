#include <gtest/gtest.h>
#include "cache_registry.h"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

class CacheRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "cache_registry_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        settings_.save_window_ms = 100;
    }

    void TearDown() override {
        try { fs::remove_all(test_dir_); } catch (...) {}
    }

    std::string cachePath(const std::string& name) const {
        return (test_dir_ / name).string();
    }

    fs::path test_dir_;
    CacheSettings settings_;
};

TEST_F(CacheRegistryTest, ObtainReturnsSameInstancePerPath) {
    CacheRegistry registry(settings_);
    auto a1 = registry.obtain(cachePath("a.mp4"));
    auto a2 = registry.obtain(cachePath("a.mp4"));
    auto b = registry.obtain(cachePath("b.mp4"));

    EXPECT_EQ(a1, a2);
    EXPECT_NE(a1, b);
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(CacheRegistryTest, FindDoesNotLoad) {
    CacheRegistry registry(settings_);
    EXPECT_EQ(registry.find(cachePath("a.mp4")), nullptr);
    EXPECT_EQ(registry.size(), 0u);

    auto a = registry.obtain(cachePath("a.mp4"));
    EXPECT_EQ(registry.find(cachePath("a.mp4")), a);
}

TEST_F(CacheRegistryTest, EvictDropsEntryOnly) {
    CacheRegistry registry(settings_);
    auto a = registry.obtain(cachePath("a.mp4"));
    a->addFragment(0, 10);
    ASSERT_TRUE(a->flush());

    EXPECT_TRUE(registry.evict(cachePath("a.mp4")));
    EXPECT_FALSE(registry.evict(cachePath("a.mp4")));
    EXPECT_EQ(registry.size(), 0u);

    // The snapshot file is left for the caller to delete.
    EXPECT_TRUE(fs::exists(registry.snapshotPathFor(cachePath("a.mp4"))));

    // A new obtain reloads from disk into a new instance.
    auto reloaded = registry.obtain(cachePath("a.mp4"));
    EXPECT_NE(reloaded, a);
    EXPECT_EQ(*reloaded->fragments(), (std::vector<Fragment>{{0, 10}}));
}

TEST_F(CacheRegistryTest, FlushAllWritesEveryEntry) {
    CacheRegistry registry(settings_);
    registry.obtain(cachePath("a.mp4"))->addFragment(0, 1);
    registry.obtain(cachePath("b.mp4"))->addFragment(5, 5);

    EXPECT_EQ(registry.flushAll(), 0);
    EXPECT_TRUE(fs::exists(registry.snapshotPathFor(cachePath("a.mp4"))));
    EXPECT_TRUE(fs::exists(registry.snapshotPathFor(cachePath("b.mp4"))));
}

TEST_F(CacheRegistryTest, PathsListsRegisteredEntries) {
    CacheRegistry registry(settings_);
    registry.obtain(cachePath("b.mp4"));
    registry.obtain(cachePath("a.mp4"));

    auto paths = registry.paths();
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_NE(std::find(paths.begin(), paths.end(), cachePath("a.mp4")), paths.end());
    EXPECT_NE(std::find(paths.begin(), paths.end(), cachePath("b.mp4")), paths.end());
}

TEST_F(CacheRegistryTest, SettingsAreNormalized) {
    settings_.save_window_ms = 0;
    settings_.snapshot_extension = ".cfg";
    CacheRegistry registry(settings_);

    EXPECT_EQ(registry.settings().save_window_ms, CacheSettings::kMinSaveWindowMs);
    EXPECT_EQ(registry.snapshotPathFor("/x/a.mp4"), "/x/a.mp4.cfg");
}

TEST_F(CacheRegistryTest, ConcurrentObtainYieldsOneInstance) {
    CacheRegistry registry(settings_);
    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<CacheConfiguration>> results(kThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            results[t] = registry.obtain(cachePath("shared.mp4"));
            results[t]->addFragment(t * 10, 10);
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    for (int t = 1; t < kThreads; ++t) {
        EXPECT_EQ(results[t], results[0]);
    }
    EXPECT_EQ(*results[0]->fragments(), (std::vector<Fragment>{{0, kThreads * 10}}));
}

TEST_F(CacheRegistryTest, DestructionWithArmedSaveIsSafe) {
    {
        CacheRegistry registry(settings_);
        auto a = registry.obtain(cachePath("a.mp4"));
        a->addFragment(0, 1);
        a->save();
        a->save();
    } // registry and timers go away before the window closes
    SUCCEED();
}

TEST_F(CacheRegistryTest, ConfigurationOutlivingRegistryStillSaves) {
    std::shared_ptr<CacheConfiguration> kept;
    {
        CacheRegistry registry(settings_);
        kept = registry.obtain(cachePath("a.mp4"));
    }

    kept->addFragment(0, 10);
    kept->save();
    kept->addFragment(10, 5);
    kept->save();
    EXPECT_EQ(kept->pendingSaveCount(), 0);

    CacheRegistry reopened(settings_);
    auto reloaded = reopened.obtain(cachePath("a.mp4"));
    EXPECT_EQ(*reloaded->fragments(), (std::vector<Fragment>{{0, 15}}));
}

TEST_F(CacheRegistryTest, ObtainKeepsExistingEntryWhenReloadWouldDiffer) {
    CacheRegistry registry(settings_);
    auto first = registry.obtain(cachePath("a.mp4"));
    first->addFragment(0, 4);  // in memory only, never flushed

    auto again = registry.obtain(cachePath("a.mp4"));
    EXPECT_EQ(again, first);
    EXPECT_EQ(*again->fragments(), (std::vector<Fragment>{{0, 4}}));
    EXPECT_FALSE(fs::exists(registry.snapshotPathFor(cachePath("a.mp4"))));
}

} // namespace
