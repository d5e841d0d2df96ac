#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include "amlnet/core/result_cache.hpp"

using namespace amlnet::core;

namespace {
using Cache = ResultCache<std::string, int>;

struct FakeClock {
  Cache::Clock::time_point now {};
  Cache::NowFn fn() {
    return [this] { return now; };
  }
};

std::shared_ptr<const int> value(int v) { return std::make_shared<const int>(v); }
} // namespace

TEST(ResultCache, HitsAndMisses) {
  FakeClock clock;
  Cache cache(4, std::chrono::seconds(10), clock.fn());
  EXPECT_EQ(cache.get("a"), nullptr);
  cache.put("a", value(1));
  auto hit = cache.get("a");
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(*hit, 1);
  EXPECT_EQ(cache.hits(), 1u);
  EXPECT_EQ(cache.misses(), 1u);
}

TEST(ResultCache, EntriesExpireAfterTtl) {
  FakeClock clock;
  Cache cache(4, std::chrono::seconds(10), clock.fn());
  cache.put("a", value(1));
  clock.now += std::chrono::seconds(9);
  EXPECT_NE(cache.get("a"), nullptr);
  clock.now += std::chrono::seconds(1);
  EXPECT_EQ(cache.get("a"), nullptr);
  EXPECT_EQ(cache.size(), 0u);
}

TEST(ResultCache, EvictsLeastRecentlyUsed) {
  FakeClock clock;
  Cache cache(2, std::chrono::seconds(10), clock.fn());
  cache.put("a", value(1));
  cache.put("b", value(2));
  (void)cache.get("a");
  cache.put("c", value(3));
  EXPECT_EQ(cache.size(), 2u);
  EXPECT_NE(cache.get("a"), nullptr);
  EXPECT_EQ(cache.get("b"), nullptr);
  EXPECT_NE(cache.get("c"), nullptr);
}

TEST(ResultCache, PutReplacesExistingEntry) {
  FakeClock clock;
  Cache cache(2, std::chrono::seconds(10), clock.fn());
  cache.put("a", value(1), {"X"});
  cache.put("a", value(2), {"Y"});
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(*cache.get("a"), 2);
  EXPECT_EQ(cache.invalidate_entity("X"), 0u);
  EXPECT_EQ(cache.invalidate_entity("Y"), 1u);
}

TEST(ResultCache, InvalidateByEntityTag) {
  FakeClock clock;
  Cache cache(8, std::chrono::seconds(10), clock.fn());
  cache.put("a", value(1), {"E1", "E2"});
  cache.put("b", value(2), {"E2", "E3"});
  cache.put("c", value(3), {"E4"});
  EXPECT_EQ(cache.invalidate_entity("E2"), 2u);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_NE(cache.get("c"), nullptr);
  cache.invalidate_all();
  EXPECT_EQ(cache.size(), 0u);
}

TEST(ResultCache, ReadersKeepSnapshotsAlive) {
  FakeClock clock;
  Cache cache(1, std::chrono::seconds(10), clock.fn());
  cache.put("a", value(7), {"E"});
  auto held = cache.get("a");
  cache.invalidate_entity("E");
  ASSERT_NE(held, nullptr);
  EXPECT_EQ(*held, 7);
}

TEST(ResultCache, ZeroCapacityStoresNothing) {
  Cache cache(0);
  cache.put("a", value(1));
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(cache.ttl().count(), 900);
}
