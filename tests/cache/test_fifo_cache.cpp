#include <gtest/gtest.h>
#include "efe/cache.hpp"

#include <fmt/format.h>

#include <string>
#include <thread>
#include <vector>

using namespace efe;
using namespace efe::cache;

// ─── Helpers ──────────────────────────────────────────────────────────────────

static CalculationResult result_with(double horizon) {
    return CalculationResult{
        .type    = CalculationType::Schwarzschild,
        .scalars = {{"eventHorizon", horizon}},
    };
}

static std::string key(int i) { return fmt::format("k{}", i); }

// ─── Basic operations ─────────────────────────────────────────────────────────

TEST(FifoCache, MissThenHit) {
    FifoResultCache cache(4);
    EXPECT_FALSE(cache.get("a").has_value());

    cache.put("a", result_with(1.0));
    auto hit = cache.get("a");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->scalar("eventHorizon"), 1.0);

    auto s = cache.stats();
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.entries, 1u);
    EXPECT_EQ(s.capacity, 4u);
}

TEST(FifoCache, DefaultCapacityIsOneHundred) {
    FifoResultCache cache;
    EXPECT_EQ(cache.capacity(), 100u);
}

TEST(FifoCache, ZeroCapacityRaisedToOne) {
    FifoResultCache cache(0);
    EXPECT_EQ(cache.capacity(), 1u);
    cache.put("a", result_with(1.0));
    cache.put("b", result_with(2.0));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains("b"));
}

TEST(FifoCache, ContainsDoesNotCountTraffic) {
    FifoResultCache cache(2);
    cache.put("a", result_with(1.0));
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_EQ(cache.stats().hits, 0u);
    EXPECT_EQ(cache.stats().misses, 0u);
}

TEST(FifoCache, ClearEmptiesAndResetsCounters) {
    FifoResultCache cache(2);
    cache.put("a", result_with(1.0));
    (void)cache.get("a");
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.stats().hits, 0u);
    EXPECT_FALSE(cache.contains("a"));
}

// ─── FIFO eviction ────────────────────────────────────────────────────────────

TEST(FifoCache, HundredAndFirstKeyEvictsFirstEvenIfJustRead) {
    FifoResultCache cache;  // 100 entries
    for (int i = 0; i < 100; ++i) {
        cache.put(key(i), result_with(i));
    }
    ASSERT_EQ(cache.size(), 100u);

    // Reading k0 must not protect it: this is FIFO, not LRU.
    ASSERT_TRUE(cache.get(key(0)).has_value());

    cache.put(key(100), result_with(100));

    EXPECT_EQ(cache.size(), 100u);
    EXPECT_FALSE(cache.contains(key(0)));
    EXPECT_TRUE(cache.contains(key(1)));
    EXPECT_TRUE(cache.contains(key(100)));
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST(FifoCache, EvictsInInsertionOrder) {
    FifoResultCache cache(3);
    cache.put("a", result_with(1));
    cache.put("b", result_with(2));
    cache.put("c", result_with(3));
    cache.put("d", result_with(4));
    EXPECT_FALSE(cache.contains("a"));
    cache.put("e", result_with(5));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_EQ(cache.stats().evictions, 2u);
}

TEST(FifoCache, OverwriteKeepsPositionAndValueUpdated) {
    FifoResultCache cache(2);
    cache.put("a", result_with(1));
    cache.put("b", result_with(2));
    cache.put("a", result_with(10));   // overwrite, still oldest

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.get("a")->scalar("eventHorizon"), 10.0);

    cache.put("c", result_with(3));
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("b"));
    EXPECT_EQ(cache.stats().evictions, 1u);
}

// ─── Concurrency ──────────────────────────────────────────────────────────────

TEST(FifoCache, ConcurrentInsertsNeverExceedCapacity) {
    FifoResultCache cache(50);
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 200;

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                cache.put(fmt::format("t{}-{}", t, i), result_with(i));
                (void)cache.get(fmt::format("t{}-{}", t, i / 2));
            }
        });
    }
    for (auto& w : workers) w.join();

    const auto s = cache.stats();
    EXPECT_EQ(s.entries, 50u);
    EXPECT_EQ(s.evictions, static_cast<std::uint64_t>(THREADS * PER_THREAD - 50));
}

// ─── Cache keys ───────────────────────────────────────────────────────────────

TEST(CacheKey, SchwarzschildFieldOrder) {
    auto k = make_cache_key(SchwarzschildParams{.mass = 1.0, .radius = 10.0, .theta = 0.5});
    EXPECT_EQ(k, "schwarzschild:[1,10,0.5]");
}

TEST(CacheKey, ShortestRoundTripDoubles) {
    auto k = make_cache_key(HawkingParams{.mass = 0.1, .charge = 0.0, .angular_momentum = 1e-20});
    EXPECT_EQ(k, "hawking_radiation:[0.1,0,1e-20]");
}

TEST(CacheKey, DistinctTypesDistinctKeys) {
    auto s = make_cache_key(SchwarzschildParams{.mass = 1.0, .radius = 10.0, .theta = 1.0});
    auto h = make_cache_key(HawkingParams{.mass = 1.0, .charge = 10.0, .angular_momentum = 1.0});
    EXPECT_NE(s, h);
}

TEST(CacheKey, EinsteinAndStubKeys) {
    EXPECT_EQ(make_cache_key(EinsteinTensorParams{"kerr"}), "einstein_tensor:[kerr]");
    EXPECT_EQ(make_cache_key(StubParams{CalculationType::DarkMatter}), "dark_matter:[]");
}

TEST(CacheKey, FlrwIncludesHubble) {
    FlrwParams a{.scale_factor = 1.0, .k = 0.0, .radius = 0.5, .theta = 1.0, .hubble_parameter = 70.0};
    FlrwParams b = a;
    b.hubble_parameter = 67.0;
    EXPECT_NE(make_cache_key(a), make_cache_key(b));
}
