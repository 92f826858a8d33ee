#include <gtest/gtest.h>
#include "cache/snapshot_cache.hpp"

using namespace prism;
using namespace std::chrono_literals;

class SnapshotCacheTest : public ::testing::Test {
protected:
    Timestamp now_ = Timestamp{} + 1h;

    SnapshotCache make_cache(std::chrono::steady_clock::duration ttl = 8s) {
        return SnapshotCache(ttl, [this] { return now_; });
    }

    static MarketSnapshot snapshot_with_price(double price) {
        MarketSnapshot snapshot;
        snapshot.symbol = "BTCUSDT";
        snapshot.exchange = "okx";
        snapshot.source = "okx";
        snapshot.instrument_id = "BTC-USDT-SWAP";
        snapshot.price = price;
        snapshot.timestamp = "2024-05-01T12:00:00Z";
        return snapshot;
    }

    const CacheKey key_{"okx", "BTC-USDT-SWAP", ""};
};

TEST_F(SnapshotCacheTest, MissOnEmptyCache) {
    SnapshotCache cache(8s);

    EXPECT_FALSE(cache.get(key_));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(SnapshotCacheTest, HitWithinTtl) {
    auto cache = make_cache();
    cache.put(key_, snapshot_with_price(65000.0));

    now_ += 8s;
    auto hit = cache.get(key_);

    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->price, 65000.0);
}

TEST_F(SnapshotCacheTest, ExpiredEntryIsEvicted) {
    auto cache = make_cache();
    cache.put(key_, snapshot_with_price(65000.0));

    now_ += 8s + 1ms;
    EXPECT_FALSE(cache.get(key_));
    EXPECT_EQ(cache.size(), 0u);

    // Going back in time does not bring it back
    now_ -= 5s;
    EXPECT_FALSE(cache.get(key_));
}

TEST_F(SnapshotCacheTest, StaleEntriesCountUntilLookedUp) {
    auto cache = make_cache();
    cache.put(key_, snapshot_with_price(1.0));

    now_ += 1min;
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_FALSE(cache.get(key_));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(SnapshotCacheTest, PutOverwritesAndRestartsAge) {
    auto cache = make_cache();
    cache.put(key_, snapshot_with_price(1.0));

    now_ += 6s;
    cache.put(key_, snapshot_with_price(2.0));

    now_ += 6s;
    auto hit = cache.get(key_);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->price, 2.0);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(SnapshotCacheTest, LabelsAreDistinctKeys) {
    auto cache = make_cache();
    cache.put(CacheKey{"okx", "BTC-USDT-SWAP", ""}, snapshot_with_price(1.0));

    EXPECT_FALSE(cache.get(CacheKey{"OKX", "BTC-USDT-SWAP", ""}));
    EXPECT_FALSE(cache.get(CacheKey{"okx", "BTC-USDT-SWAP", "4H"}));
    EXPECT_TRUE(cache.get(CacheKey{"okx", "BTC-USDT-SWAP", ""}));
}

TEST_F(SnapshotCacheTest, ZeroTtlServesOnlySameInstant) {
    auto cache = make_cache(0s);
    cache.put(key_, snapshot_with_price(1.0));

    EXPECT_TRUE(cache.get(key_));
    now_ += 1ns;
    EXPECT_FALSE(cache.get(key_));
}

TEST_F(SnapshotCacheTest, ClearRemovesEverything) {
    auto cache = make_cache();
    cache.put(key_, snapshot_with_price(1.0));
    cache.put(CacheKey{"bybit", "BTCUSDT", ""}, snapshot_with_price(2.0));

    cache.clear();

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.ttl(), std::chrono::steady_clock::duration(8s));
}
