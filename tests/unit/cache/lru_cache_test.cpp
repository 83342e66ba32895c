#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "docqa_core/cache/lru_cache.hpp"

namespace docqa_core {

class LRUCacheTest : public ::testing::Test {
 protected:
  using Cache = LRUCache<std::string, int>;

  // Manually advanced clock for TTL tests
  Cache::Clock::time_point now_ = Cache::Clock::time_point{} + std::chrono::hours(1);
  Cache::NowFn clock_ = [this] { return now_; };
};

TEST_F(LRUCacheTest, RejectsZeroCapacity) {
  EXPECT_THROW(Cache(0), std::invalid_argument);
}

TEST_F(LRUCacheTest, EvictsLeastRecentlyUsed) {
  Cache cache(2);
  cache.put("a", 1);
  cache.put("b", 2);
  ASSERT_TRUE(cache.get("a").has_value());  // "b" is now the oldest
  cache.put("c", 3);

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_EQ(cache.get("a"), 1);
  EXPECT_FALSE(cache.get("b").has_value());
  EXPECT_EQ(cache.get("c"), 3);
}

TEST_F(LRUCacheTest, PutOverwritesWithoutGrowing) {
  Cache cache(2);
  cache.put("a", 1);
  cache.put("a", 10);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(cache.get("a"), 10);
}

TEST_F(LRUCacheTest, EntriesExpireAfterTtl) {
  Cache cache(10, std::chrono::seconds(60), clock_);
  cache.put("a", 1);

  now_ += std::chrono::seconds(59);
  EXPECT_EQ(cache.get("a"), 1);

  now_ += std::chrono::seconds(1);
  EXPECT_FALSE(cache.get("a").has_value());
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(LRUCacheTest, ZeroTtlNeverExpires) {
  Cache cache(10, std::chrono::seconds(0), clock_);
  cache.put("a", 1);
  now_ += std::chrono::hours(24 * 365);
  EXPECT_EQ(cache.get("a"), 1);
}

TEST_F(LRUCacheTest, EraseAndClear) {
  Cache cache(5);
  cache.put("a", 1);
  cache.put("b", 2);
  EXPECT_TRUE(cache.erase("a"));
  EXPECT_FALSE(cache.erase("a"));
  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(cache.capacity(), 5u);
}

TEST_F(LRUCacheTest, ConcurrentAccessStaysWithinCapacity) {
  Cache cache(50);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t]() {
      for (int i = 0; i < 500; ++i) {
        const std::string key = std::to_string((t * 1000 + i) % 120);
        cache.put(key, i);
        cache.get(key);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_LE(cache.size(), 50u);
}

}  // namespace docqa_core
