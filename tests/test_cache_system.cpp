#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "core/cache_system.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace LRP;

// EN: Test fixture for CacheSystem tests
// FR: Fixture de test pour les tests de CacheSystem
class CacheSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }
};

TEST_F(CacheSystemTest, StoresAndRetrievesValues) {
    CacheSystem cache;
    EXPECT_FALSE(cache.get("missing").has_value());

    cache.set("preprocessing:\x1fExplain recursion", "normalized task");
    auto value = cache.get("preprocessing:\x1fExplain recursion");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "normalized task");

    cache.set("preprocessing:\x1fExplain recursion", "updated");
    EXPECT_EQ(cache.get("preprocessing:\x1fExplain recursion").value_or(""), "updated");
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(CacheSystemTest, ExpiresEntriesAfterTtl) {
    CacheSystem cache;
    cache.set("short", "value", std::chrono::seconds(1));
    cache.set("forever", "value");

    EXPECT_TRUE(cache.exists("short"));
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_FALSE(cache.get("short").has_value());
    EXPECT_FALSE(cache.exists("short"));
    EXPECT_TRUE(cache.exists("forever"));
    EXPECT_GE(cache.getStats().expirations, 1u);
}

TEST_F(CacheSystemTest, CleanupReclaimsExpiredEntries) {
    CacheSystem cache;
    cache.set("a", "1", std::chrono::milliseconds(10));
    cache.set("b", "2", std::chrono::milliseconds(10));
    cache.set("c", "3");
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.cleanup(), 2u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(CacheSystemTest, RemoveExistsAndClear) {
    CacheSystem cache;
    cache.set("k1", "v1");
    cache.set("k2", "v2");

    EXPECT_TRUE(cache.remove("k1"));
    EXPECT_FALSE(cache.remove("k1"));
    EXPECT_FALSE(cache.exists("k1"));
    EXPECT_TRUE(cache.exists("k2"));

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.exists("k2"));
}

TEST_F(CacheSystemTest, EvictsLeastRecentlyUsedWhenFull) {
    CacheConfig config;
    config.max_entries = 3;
    CacheSystem cache(config);

    std::vector<std::string> evicted;
    cache.setEventCallback([&evicted](const std::string& event, const std::string& key) {
        if (event == "evicted") {
            evicted.push_back(key);
        }
    });

    cache.set("a", "1");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    cache.set("b", "2");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    cache.set("c", "3");
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    ASSERT_TRUE(cache.get("a").has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(2));

    cache.set("d", "4");

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "b");
    EXPECT_TRUE(cache.exists("a"));
    EXPECT_TRUE(cache.exists("d"));
    EXPECT_EQ(cache.getStats().evictions, 1u);
}

TEST_F(CacheSystemTest, CompressesLargeValuesTransparently) {
    CacheConfig config;
    config.enable_compression = true;
    config.compression_threshold = 64;
    CacheSystem cache(config);

    std::string large;
    for (int i = 0; i < 500; ++i) {
        large += "Perspective " + std::to_string(i % 7) + ": consider the base case. ";
    }
    cache.set("large", large);
    cache.set("small", "tiny");

    EXPECT_EQ(cache.get("large").value_or(""), large);
    EXPECT_EQ(cache.get("small").value_or(""), "tiny");
    EXPECT_LT(cache.getStats().memory_usage_bytes, large.size());
}

TEST_F(CacheSystemTest, TracksHitRatio) {
    CacheSystem cache;
    cache.set("k", "v");
    cache.get("k");
    cache.get("k");
    cache.get("other");

    auto stats = cache.getStats();
    EXPECT_EQ(stats.total_requests, 3u);
    EXPECT_EQ(stats.cache_hits, 2u);
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_NEAR(stats.hit_ratio, 2.0 / 3.0, 1e-9);
}

TEST_F(CacheSystemTest, AutoCleanupRunsInBackground) {
    CacheSystem cache;
    cache.set("ephemeral", "v", std::chrono::milliseconds(5));
    cache.enableAutoCleanup(true, std::chrono::milliseconds(20));

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(cache.size(), 0u);

    cache.enableAutoCleanup(false);
}

TEST_F(CacheSystemTest, ConcurrentAccessIsSafe) {
    CacheSystem cache;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                const std::string key = "k" + std::to_string(i % 20);
                cache.set(key, std::to_string(t));
                cache.get(key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(cache.size(), 20u);
}
