#include <gtest/gtest.h>

#include "contour/cache/cache_key.h"
#include "contour/cache/memory_cache.h"
#include "contour/core/string_utils.h"

#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

using namespace contour;
using namespace contour::cache;

namespace {

MemoryCache::Value docOfWidth(double w) {
    auto d = std::make_shared<ParsedDocument>();
    d->width = w;
    d->height = 1.0;
    return d;
}

CacheKey key(const std::string& hash, ComputeMode mode = ComputeMode::Cpu) { return makeCacheKey(hash, mode); }

} // namespace

TEST(CacheKeyTest, TextAndFileName) {
    const CacheKey k(3, "p1", "deadbeef", ComputeMode::Accelerated);
    EXPECT_EQ(k.toString(), "3:p1:deadbeef:accelerated");
    EXPECT_EQ(k.fileName(), "deadbeef-accelerated.bin");
    EXPECT_EQ(cacheFileName("deadbeef", ComputeMode::Cpu), "deadbeef-cpu.bin");
}

TEST(CacheKeyTest, EveryComponentMatters) {
    const CacheKey base(3, "p1", "h", ComputeMode::Cpu);
    EXPECT_EQ(base, CacheKey(3, "p1", "h", ComputeMode::Cpu));
    EXPECT_NE(base, CacheKey(4, "p1", "h", ComputeMode::Cpu));
    EXPECT_NE(base, CacheKey(3, "p2", "h", ComputeMode::Cpu));
    EXPECT_NE(base, CacheKey(3, "p1", "g", ComputeMode::Cpu));
    EXPECT_NE(base, CacheKey(3, "p1", "h", ComputeMode::Accelerated));
    EXPECT_EQ(CacheKeyHash{}(base), CacheKeyHash{}(CacheKey(3, "p1", "h", ComputeMode::Cpu)));
}

TEST(CacheKeyTest, ContentHashIsStableFnv1a) {
    // Cache file names on disk depend on these exact values.
    EXPECT_EQ(contentHashHex(nullptr, 0), "08328807b4eb6fed");
    const std::uint8_t abc[] = {'a', 'b', 'c', 0};
    EXPECT_EQ(contentHashHex(abc, 3), "639de02d766bd288");
    // The length is folded in, so a trailing NUL still changes the hash.
    EXPECT_EQ(contentHashHex(abc, 4), "cb207e4047fa45bd");
}

TEST(MemoryCacheTest, MissThenHit) {
    MemoryCache cache(100);
    EXPECT_EQ(cache.get(key("a")), nullptr);
    cache.put(key("a"), docOfWidth(1.0), 10);
    const auto v = cache.get(key("a"));
    ASSERT_NE(v, nullptr);
    EXPECT_DOUBLE_EQ(v->width, 1.0);
    EXPECT_FALSE(cache.contains(key("a", ComputeMode::Accelerated)));
}

TEST(MemoryCacheTest, EvictsLeastRecentlyUsed) {
    MemoryCache cache(30);
    cache.put(key("a"), docOfWidth(1.0), 10);
    cache.put(key("b"), docOfWidth(2.0), 10);
    cache.put(key("c"), docOfWidth(3.0), 10);

    // Touch a so b is the coldest.
    ASSERT_NE(cache.get(key("a")), nullptr);
    cache.put(key("d"), docOfWidth(4.0), 10);

    EXPECT_TRUE(cache.contains(key("a")));
    EXPECT_FALSE(cache.contains(key("b")));
    EXPECT_TRUE(cache.contains(key("c")));
    EXPECT_TRUE(cache.contains(key("d")));

    const CacheStats s = cache.stats();
    EXPECT_EQ(s.entries, 3u);
    EXPECT_EQ(s.bytes, 30u);
    EXPECT_EQ(s.maxBytes, 30u);
}

TEST(MemoryCacheTest, ReplaceUpdatesSizeAndValue) {
    MemoryCache cache(100);
    cache.put(key("a"), docOfWidth(1.0), 40);
    cache.put(key("a"), docOfWidth(2.0), 15);
    EXPECT_EQ(cache.stats().entries, 1u);
    EXPECT_EQ(cache.stats().bytes, 15u);
    EXPECT_DOUBLE_EQ(cache.get(key("a"))->width, 2.0);
}

TEST(MemoryCacheTest, OversizedEntryDoesNotStay) {
    MemoryCache cache(50);
    cache.put(key("small"), docOfWidth(1.0), 20);
    cache.put(key("huge"), docOfWidth(2.0), 500);
    EXPECT_FALSE(cache.contains(key("huge")));
    EXPECT_FALSE(cache.contains(key("small")));
    EXPECT_EQ(cache.stats().bytes, 0u);
}

TEST(MemoryCacheTest, SizesAreAtLeastOneByte) {
    MemoryCache cache(0);
    EXPECT_EQ(cache.maxBytes(), 1u);
    cache.put(key("a"), docOfWidth(1.0), 0);
    EXPECT_TRUE(cache.contains(key("a")));
    EXPECT_EQ(cache.stats().bytes, 1u);
    cache.put(key("b"), docOfWidth(1.0), 0);
    EXPECT_FALSE(cache.contains(key("a")));
    EXPECT_TRUE(cache.contains(key("b")));
}

TEST(MemoryCacheTest, EvictedValueStaysAliveForReader) {
    MemoryCache cache(10);
    cache.put(key("a"), docOfWidth(7.0), 10);
    const auto held = cache.get(key("a"));
    cache.put(key("b"), docOfWidth(8.0), 10);
    EXPECT_FALSE(cache.contains(key("a")));
    ASSERT_NE(held, nullptr);
    EXPECT_DOUBLE_EQ(held->width, 7.0);
}

TEST(MemoryCacheTest, ClearEmptiesEverything) {
    MemoryCache cache(100);
    cache.put(key("a"), docOfWidth(1.0), 10);
    cache.put(key("b"), docOfWidth(1.0), 10);
    cache.clear();
    EXPECT_EQ(cache.stats().entries, 0u);
    EXPECT_EQ(cache.stats().bytes, 0u);
    EXPECT_EQ(cache.get(key("a")), nullptr);
}

TEST(MemoryCacheTest, ConcurrentUseKeepsBudget) {
    MemoryCache cache(1000);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                const std::string h = std::to_string((t * 7 + i) % 64);
                cache.put(key(h), docOfWidth(i), 25);
                cache.get(key(std::to_string(i % 64)));
            }
        });
    }
    for (auto& th : threads) th.join();
    const CacheStats s = cache.stats();
    EXPECT_LE(s.bytes, 1000u);
    EXPECT_EQ(s.bytes, s.entries * 25u);
}
