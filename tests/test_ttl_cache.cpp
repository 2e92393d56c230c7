#include <gtest/gtest.h>
#include <string>
#include "route_store.hpp"
#include "ttl_cache.hpp"

class TtlCacheTest : public ::testing::Test {
protected:
    TtlCache<std::string>::Clock::time_point now = TtlCache<std::string>::Clock::now();
    TtlCache<std::string> cache{[this] { return now; }};
};

TEST_F(TtlCacheTest, GetReturnsStoredValue) {
    cache.set("k", "v", std::chrono::seconds(10));
    auto hit = cache.get("k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, "v");
    EXPECT_FALSE(cache.get("missing").has_value());
}

TEST_F(TtlCacheTest, ExpiredEntriesAreDropped) {
    cache.set("k", "v", std::chrono::seconds(10));
    now += std::chrono::seconds(9);
    EXPECT_TRUE(cache.get("k").has_value());

    now += std::chrono::seconds(1);
    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(TtlCacheTest, SetRefreshesExpiry) {
    cache.set("k", "old", std::chrono::seconds(10));
    now += std::chrono::seconds(8);
    cache.set("k", "new", std::chrono::seconds(10));
    now += std::chrono::seconds(8);
    EXPECT_EQ(cache.get("k").value_or(""), "new");
}

TEST_F(TtlCacheTest, PurgeAndErase) {
    cache.set("short", "a", std::chrono::seconds(1));
    cache.set("long", "b", std::chrono::seconds(100));
    cache.set("gone", "c", std::chrono::seconds(100));
    EXPECT_EQ(cache.size(), 3u);

    EXPECT_TRUE(cache.erase("gone"));
    EXPECT_FALSE(cache.erase("gone"));

    now += std::chrono::seconds(5);
    EXPECT_EQ(cache.purge_expired(), 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(RouteStore, SaveAndLoadWithinTtl) {
    auto now = TtlCache<nlohmann::json>::Clock::now();
    RouteStore store(std::chrono::hours(24), [&] { return now; });

    OptimizationResult r;
    r.route_id = "abc";
    r.optimized_route.sequence = {0, 1};
    r.optimized_route.total_distance_km = 4.5;
    store.save(r.route_id, r);

    auto hit = store.load("abc");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ((*hit)["route_id"], "abc");
    EXPECT_EQ((*hit)["optimized_route"]["total_distance_km"], 4.5);

    now += std::chrono::hours(25);
    EXPECT_FALSE(store.load("abc").has_value());
}

TEST(RouteStore, SaveDropsExpiredRoutes) {
    auto now = TtlCache<nlohmann::json>::Clock::now();
    RouteStore store(std::chrono::hours(24), [&] { return now; });

    OptimizationResult r;
    r.route_id = "old";
    store.save(r.route_id, r);
    EXPECT_EQ(store.size(), 1u);

    now += std::chrono::hours(25);
    r.route_id = "new";
    store.save(r.route_id, r);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(store.load("new").has_value());
}
