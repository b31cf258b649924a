#include <sfera/cache/ttl_cache.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using sfera::TtlCache;
using sfera::CacheStats;

TEST(TtlCacheTest, EntryExpiresAtTtlBoundary) {
    TtlCache<std::string> cache(10, 100);
    cache.set("k", "v", 1000);
    
    std::string out;
    EXPECT_TRUE(cache.get("k", out, 10999));
    EXPECT_EQ("v", out);
    
    EXPECT_FALSE(cache.get("k", out, 11000));
    EXPECT_EQ(0u, cache.size());
    
    // The expired read counts as a miss
    CacheStats stats = cache.stats();
    EXPECT_EQ(1u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
}

TEST(TtlCacheTest, MissingKeyIsAMiss) {
    TtlCache<int> cache(10, 10);
    int out = -1;
    EXPECT_FALSE(cache.get("absent", out, 0));
    EXPECT_EQ(-1, out);
    EXPECT_EQ(1u, cache.stats().misses);
}

TEST(TtlCacheTest, EvictsOldestEntryAtCapacity) {
    TtlCache<int> cache(300, 2);
    cache.set("a", 1, 100);
    cache.set("b", 2, 200);
    cache.set("c", 3, 300);
    
    int out = 0;
    EXPECT_EQ(2u, cache.size());
    EXPECT_FALSE(cache.get("a", out, 400));
    EXPECT_TRUE(cache.get("b", out, 400));
    EXPECT_TRUE(cache.get("c", out, 400));
}

TEST(TtlCacheTest, OverwriteRefreshesTimestampWithoutEvicting) {
    TtlCache<int> cache(10, 2);
    cache.set("a", 1, 0);
    cache.set("b", 2, 5000);
    cache.set("a", 10, 8000);
    
    EXPECT_EQ(2u, cache.size());
    
    int out = 0;
    // Original write of "a" would have expired at 10000
    EXPECT_TRUE(cache.get("a", out, 12000));
    EXPECT_EQ(10, out);
    EXPECT_TRUE(cache.get("b", out, 12000));
    
    // "b" is now the oldest
    cache.set("c", 3, 13000);
    EXPECT_FALSE(cache.get("b", out, 13000));
    EXPECT_TRUE(cache.get("a", out, 13000));
}

TEST(TtlCacheTest, HitRateStats) {
    TtlCache<int> cache(60, 5);
    CacheStats empty = cache.stats();
    EXPECT_DOUBLE_EQ(0.0, empty.hit_rate);
    EXPECT_EQ(5u, empty.max_size);
    EXPECT_EQ(60, empty.ttl_seconds);
    
    cache.set("x", 1, 0);
    int out = 0;
    cache.get("x", out, 1);
    cache.get("x", out, 2);
    EXPECT_DOUBLE_EQ(1.0, cache.stats().hit_rate);
    
    cache.get("y", out, 3);
    CacheStats s = cache.stats();
    EXPECT_EQ(2u, s.hits);
    EXPECT_EQ(1u, s.misses);
    EXPECT_NEAR(2.0 / 3.0, s.hit_rate, 1e-9);
}

TEST(TtlCacheTest, ClearIsIdempotent) {
    TtlCache<int> cache(60, 5);
    cache.set("x", 1);
    int out = 0;
    cache.get("x", out);
    
    cache.clear();
    cache.clear();
    
    CacheStats s = cache.stats();
    EXPECT_EQ(0u, s.size);
    EXPECT_EQ(0u, s.hits);
    EXPECT_EQ(0u, s.misses);
}

TEST(TtlCacheTest, ZeroCapacityHoldsOneEntry) {
    TtlCache<int> cache(60, 0);
    cache.set("a", 1, 0);
    cache.set("b", 2, 1);
    EXPECT_EQ(1u, cache.size());
    EXPECT_EQ(1u, cache.stats().max_size);
}

TEST(TtlCacheTest, GetOrComputeStoresOnlySuccesses) {
    TtlCache<std::string> cache(60, 10);
    int calls = 0;
    
    EXPECT_EQ("computed", cache.get_or_compute("k", [&calls]() {
        ++calls;
        return std::string("computed");
    }));
    EXPECT_EQ("computed", cache.get_or_compute("k", [&calls]() {
        ++calls;
        return std::string("again");
    }));
    EXPECT_EQ(1, calls);
    
    EXPECT_THROW(cache.get_or_compute("bad", []() -> std::string {
        throw std::runtime_error("upstream down");
    }), std::runtime_error);
    EXPECT_EQ(1u, cache.size());
}
