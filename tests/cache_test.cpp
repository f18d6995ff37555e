// devbroker headers
#include "core/CommandCache.hpp"

// devbroker fakes
#include "ManualClock.hpp"

// GTest headers
#include <gtest/gtest.h>

namespace devbroker::test {

  using core::CommandCache;
  using namespace std::chrono_literals;

  class CommandCacheTest : public ::testing::Test {
  protected:
    ManualClock clock;
    CommandCache cache{ 60s, clock.fn() };
  };

  TEST_F(CommandCacheTest, get_ReturnsStoredOutputWhileFresh) {
    cache.set("d1", "show version", "IOS XE 17.9");
    clock.advance(59s);

    auto hit = cache.get("d1", "show version");
    ASSERT_TRUE(hit);
    EXPECT_EQ(*hit, "IOS XE 17.9");
  }

  TEST_F(CommandCacheTest, get_ExpiresExactlyAtTtl) {
    cache.set("d1", "show version", "IOS XE 17.9");
    clock.advance(60s);

    EXPECT_FALSE(cache.get("d1", "show version"));
    EXPECT_EQ(cache.totalEntries(), 0u); // the stale entry was removed by the read
    EXPECT_TRUE(cache.devicesWithCache().empty());
  }

  TEST_F(CommandCacheTest, get_MatchesCommandTextExactly) {
    cache.set("d1", "show version", "out");

    EXPECT_FALSE(cache.get("d1", "show  version"));
    EXPECT_FALSE(cache.get("d1", "SHOW VERSION"));
    EXPECT_FALSE(cache.get("d2", "show version"));
    EXPECT_TRUE(cache.get("d1", "show version"));
  }

  TEST_F(CommandCacheTest, set_OverwritesAndRestartsTheClock) {
    cache.set("d1", "show clock", "10:00");
    clock.advance(50s);
    cache.set("d1", "show clock", "10:50");
    clock.advance(50s);

    auto hit = cache.get("d1", "show clock");
    ASSERT_TRUE(hit);
    EXPECT_EQ(*hit, "10:50");
  }

  TEST_F(CommandCacheTest, clear_DropsOnlyThatDevice) {
    cache.set("d1", "a", "1");
    cache.set("d1", "b", "2");
    cache.set("d2", "a", "3");

    cache.clear("d1");

    EXPECT_FALSE(cache.get("d1", "a"));
    EXPECT_FALSE(cache.get("d1", "b"));
    EXPECT_TRUE(cache.get("d2", "a"));
    EXPECT_EQ(cache.devicesWithCache(), std::vector<std::string>{ "d2" });
  }

  TEST_F(CommandCacheTest, stats_CountsExpiredUntilTheyAreRead) {
    cache.set("d1", "old", "x");
    clock.advance(61s);
    cache.set("d1", "new", "y");

    auto s = cache.stats("d1");
    EXPECT_EQ(s.total, 2u);
    EXPECT_EQ(s.valid, 1u);
    EXPECT_EQ(s.expired, 1u);

    EXPECT_FALSE(cache.get("d1", "old"));
    s = cache.stats("d1");
    EXPECT_EQ(s.total, 1u);
    EXPECT_EQ(s.expired, 0u);
  }

  TEST_F(CommandCacheTest, stats_UnknownDeviceIsEmpty) {
    const auto s = cache.stats("nobody");
    EXPECT_EQ(s.total, 0u);
    EXPECT_EQ(s.valid, 0u);
    EXPECT_EQ(s.expired, 0u);
  }

  // 3 devices x 5 commands, one stale-but-unread entry per device
  TEST_F(CommandCacheTest, totalEntries_IncludesUnreadExpiredEntries) {
    for (const std::string device : { "d1", "d2", "d3" }) {
      cache.set(device, "stale", "old");
    }
    clock.advance(120s);
    for (const std::string device : { "d1", "d2", "d3" }) {
      for (int i = 0; i < 4; ++i)
        cache.set(device, "cmd" + std::to_string(i), "out");
    }

    EXPECT_EQ(cache.totalEntries(), 15u);
    EXPECT_EQ(cache.stats("d2").expired, 1u);

    EXPECT_FALSE(cache.get("d2", "stale"));
    EXPECT_EQ(cache.totalEntries(), 14u);
  }

  TEST(CommandCacheDefaults, UsesOneHourTtl) {
    CommandCache cache;
    EXPECT_EQ(cache.ttl(), std::chrono::seconds(3600));
  }

  TEST(CommandCacheDefaults, InstancesDoNotShareEntries) {
    CommandCache a;
    CommandCache b;
    a.set("d1", "show version", "A");
    EXPECT_FALSE(b.get("d1", "show version"));
  }

} // namespace devbroker::test
