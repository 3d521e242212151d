#include "TtlCache.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace locus;

namespace {

class TtlCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    TtlCache<std::string> cache_{CacheConfig{std::chrono::minutes(5), true}, clock_};
};

} // namespace

TEST_F(TtlCacheTest, HitBeforeExpiry) {
    cache_.put("berlin", "52.52,13.405");
    clock_->advance(std::chrono::minutes(4));

    auto value = cache_.get("berlin");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "52.52,13.405");
}

TEST_F(TtlCacheTest, MissAtExpiry) {
    cache_.put("berlin", "52.52,13.405");
    clock_->advance(std::chrono::minutes(5));

    EXPECT_FALSE(cache_.get("berlin").has_value());
    EXPECT_EQ(cache_.size(), 0u);

    CacheStats stats = cache_.get_stats();
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_EQ(stats.expired_entries, 1u);
}

TEST_F(TtlCacheTest, PerEntryTtl) {
    cache_.put("short", "a", std::chrono::seconds(10));
    cache_.put("long", "b");
    clock_->advance(std::chrono::seconds(30));

    EXPECT_FALSE(cache_.contains("short"));
    EXPECT_TRUE(cache_.contains("long"));
}

TEST_F(TtlCacheTest, LaterWriteReplacesValueAndResetsAge) {
    cache_.put("key", "first");
    clock_->advance(std::chrono::minutes(3));
    cache_.put("key", "second");
    clock_->advance(std::chrono::minutes(3));

    auto value = cache_.get("key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "second");
}

TEST_F(TtlCacheTest, CleanupRemovesOnlyExpired) {
    cache_.put("old", "x", std::chrono::minutes(1));
    cache_.put("fresh", "y", std::chrono::minutes(10));
    clock_->advance(std::chrono::minutes(2));

    EXPECT_EQ(cache_.cleanup_expired(), 1u);
    EXPECT_EQ(cache_.keys(), std::vector<std::string>{"fresh"});
}

TEST_F(TtlCacheTest, StatsCountHitsAndMisses) {
    cache_.put("a", "1");
    cache_.get("a");
    cache_.get("a");
    cache_.get("b");

    CacheStats stats = cache_.get_stats();
    EXPECT_EQ(stats.total_requests, 3u);
    EXPECT_EQ(stats.cache_hits, 2u);
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_EQ(stats.entries, 1u);
    EXPECT_NEAR(stats.hit_rate(), 2.0 / 3.0, 1e-9);
}

TEST_F(TtlCacheTest, DisabledCacheStoresNothing) {
    cache_.set_cache_enabled(false);
    cache_.put("a", "1");
    EXPECT_FALSE(cache_.get("a").has_value());
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(TtlCacheTest, ClearAndErase) {
    cache_.put("a", "1");
    cache_.put("b", "2");
    cache_.erase("a");
    EXPECT_FALSE(cache_.contains("a"));
    EXPECT_TRUE(cache_.contains("b"));

    cache_.clear();
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(TtlCacheTest, WritesSweepExpiredKeysThatAreNeverReadAgain) {
    cache_.put("nearby:48.1,11.5", "a");
    cache_.put("nearby:52.5,13.4", "b");
    clock_->advance(std::chrono::minutes(5));

    cache_.put("nearby:50.9,6.9", "c");

    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_EQ(cache_.keys(), std::vector<std::string>{"nearby:50.9,6.9"});
    EXPECT_EQ(cache_.get_stats().expired_entries, 2u);
}

TEST_F(TtlCacheTest, WritesWithinOneIntervalDoNotSweep) {
    cache_.put("short", "a", std::chrono::seconds(10));
    clock_->advance(std::chrono::minutes(1));

    cache_.put("other", "b");

    EXPECT_EQ(cache_.size(), 2u);
    EXPECT_FALSE(cache_.contains("short"));
}
