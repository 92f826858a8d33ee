#include <gtest/gtest.h>

#include "cache/snapshot_cache.hpp"
#include "core/config.hpp"
#include "service/snapshot_service.hpp"
#include "support/fake_transport.hpp"
#include "venues/venue_registry.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace prism;
using prism::test_support::FakeTransport;
using namespace std::chrono_literals;

namespace {

constexpr const char* kOkxTicker =
    R"({"code":"0","msg":"","data":[{"instId":"BTC-USDT-SWAP","last":"65000",
        "open24h":"64000","ts":"1714564800000"}]})";

constexpr const char* kBinanceTicker =
    R"({"symbol":"ETHUSDT","lastPrice":"3000","openPrice":"3100",
        "quoteVolume":"80000000","closeTime":1714564800000})";

constexpr const char* kBybitTicker =
    R"({"retCode":0,"result":{"list":[{"symbol":"SOLUSDT","lastPrice":"150",
        "prevPrice24h":"140","turnover24h":"350000000"}]},"time":1714564800000})";

}  // namespace

// ============================================================================
// Snapshot Service Integration Tests
// ============================================================================

class SnapshotServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeTransport>();
        cache_ = std::make_shared<SnapshotCache>(8s, [this] { return now_; });
        service_ = make_service(Venue::Okx);
    }

    std::unique_ptr<SnapshotService> make_service(Venue default_venue) {
        auto registry = venues::VenueRegistry::from_config(Config::defaults(), transport_);
        EXPECT_TRUE(registry.is_ok());
        return std::make_unique<SnapshotService>(
            std::move(registry).value(), cache_, default_venue);
    }

    Timestamp now_ = Timestamp{} + 1h;
    std::shared_ptr<FakeTransport> transport_;
    std::shared_ptr<SnapshotCache> cache_;
    std::unique_ptr<SnapshotService> service_;
};

TEST_F(SnapshotServiceTest, OkxEndToEnd) {
    transport_->respond("/api/v5/market/ticker", 200, kOkxTicker);

    auto result = service_->snapshot(SnapshotRequest{"btcusdt", std::nullopt, std::nullopt});

    ASSERT_TRUE(result.is_ok());
    const auto& s = result.value();
    EXPECT_EQ(s.symbol, "BTCUSDT");
    EXPECT_EQ(s.exchange, "okx");
    EXPECT_EQ(s.source, "okx");
    EXPECT_EQ(s.instrument_id, "BTC-USDT-SWAP");
    EXPECT_EQ(s.price, 65000.0);
    EXPECT_NEAR(*s.price_change_24h, 1.5625, 1e-9);
    EXPECT_EQ(s.volatility_regime, VolatilityRegime::Low);
    EXPECT_FALSE(s.volume_24h);
    EXPECT_FALSE(s.liquidity_condition);
    EXPECT_FALSE(s.funding_rate);
    EXPECT_FALSE(s.open_interest);
    EXPECT_EQ(s.timestamp_exchange, "2024-05-01T12:00:00Z");
    EXPECT_EQ(cache_->size(), 1u);
}

TEST_F(SnapshotServiceTest, BinanceEndToEnd) {
    transport_->respond("/api/v3/ticker/24hr", 200, kBinanceTicker);
    transport_->respond("/fapi/v1/premiumIndex", 200, R"({"lastFundingRate":"0.0001"})");
    transport_->respond("/fapi/v1/openInterest", 200, R"({"openInterest":"2500"})");

    auto result = service_->snapshot(SnapshotRequest{"ETHUSDT", "Binance", std::nullopt});

    ASSERT_TRUE(result.is_ok());
    const auto& s = result.value();
    EXPECT_EQ(s.exchange, "Binance");
    EXPECT_EQ(s.source, "binance");
    EXPECT_EQ(s.instrument_id, "ETHUSDT");
    EXPECT_EQ(s.volatility_regime, VolatilityRegime::Medium);
    EXPECT_EQ(s.liquidity_condition, LiquidityCondition::Normal);
    EXPECT_EQ(s.funding_rate, 0.0001);
    EXPECT_EQ(s.open_interest_unit, "contracts");
}

TEST_F(SnapshotServiceTest, BybitEndToEnd) {
    transport_->respond("/v5/market/tickers", 200, kBybitTicker);

    auto result = service_->snapshot(SnapshotRequest{"solusdt", "bybit", "1H"});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().source, "bybit");
    EXPECT_EQ(result.value().volatility_regime, VolatilityRegime::High);
    EXPECT_EQ(result.value().liquidity_condition, LiquidityCondition::Crowded);
}

TEST_F(SnapshotServiceTest, DefaultVenueIsUsedWhenExchangeBlank) {
    transport_->respond("/v5/market/tickers", 200, kBybitTicker);
    auto service = make_service(Venue::Bybit);

    auto result = service->snapshot(SnapshotRequest{"SOLUSDT", "  ", std::nullopt});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().exchange, "bybit");
    EXPECT_EQ(result.value().source, "bybit");
    EXPECT_EQ(service->default_venue(), Venue::Bybit);
}

TEST_F(SnapshotServiceTest, CacheHitAvoidsRefetch) {
    transport_->respond("/api/v5/market/ticker", 200, kOkxTicker);

    auto first = service_->snapshot(SnapshotRequest{"BTCUSDT", "okx", std::nullopt});
    const auto calls_after_first = transport_->call_count();
    now_ += 5s;
    auto second = service_->snapshot(SnapshotRequest{"BTCUSDT", "okx", std::nullopt});

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(transport_->call_count(), calls_after_first);
}

TEST_F(SnapshotServiceTest, ExpiredEntryIsRefetched) {
    transport_->respond("/api/v5/market/ticker", 200, kOkxTicker);

    (void)service_->snapshot(SnapshotRequest{"BTCUSDT", std::nullopt, std::nullopt});
    now_ += 9s;
    (void)service_->snapshot(SnapshotRequest{"BTCUSDT", std::nullopt, std::nullopt});

    EXPECT_EQ(transport_->calls_to("/api/v5/market/ticker"), 2u);
}

TEST_F(SnapshotServiceTest, TimeframeAndLabelSplitCacheEntries) {
    transport_->respond("/api/v5/market/ticker", 200, kOkxTicker);

    (void)service_->snapshot(SnapshotRequest{"BTCUSDT", "okx", std::nullopt});
    (void)service_->snapshot(SnapshotRequest{"BTCUSDT", "okx", "4H"});
    (void)service_->snapshot(SnapshotRequest{"BTCUSDT", "OKX", std::nullopt});

    EXPECT_EQ(transport_->calls_to("/api/v5/market/ticker"), 3u);
    EXPECT_EQ(cache_->size(), 3u);
}

TEST_F(SnapshotServiceTest, UpstreamFailureIsNotCached) {
    transport_->respond("/api/v5/market/ticker", 500, "Internal Server Error");

    auto failed = service_->snapshot(SnapshotRequest{"BTCUSDT", std::nullopt, std::nullopt});

    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().kind, ErrorKind::UpstreamTransportError);
    EXPECT_EQ(http_status(failed.error().kind), 502);
    EXPECT_EQ(cache_->size(), 0u);

    // Venue recovers; the next call fetches fresh data
    transport_->respond("/api/v5/market/ticker", 200, kOkxTicker);
    auto recovered = service_->snapshot(SnapshotRequest{"BTCUSDT", std::nullopt, std::nullopt});

    ASSERT_TRUE(recovered.is_ok());
    EXPECT_EQ(recovered.value().price, 65000.0);
    EXPECT_EQ(transport_->calls_to("/api/v5/market/ticker"), 2u);
}

TEST_F(SnapshotServiceTest, TickerWithoutPriceFailsOnEveryVenue) {
    transport_->respond("/api/v5/market/ticker", 200, R"({"code":"0","data":[{"open24h":"100"}]})");
    transport_->respond("/api/v3/ticker/24hr", 200, R"({"openPrice":"100"})");
    transport_->respond("/v5/market/tickers", 200,
                        R"({"retCode":0,"result":{"list":[{"prevPrice24h":"100"}]}})");

    for (const char* exchange : {"okx", "binance", "bybit"}) {
        auto result = service_->snapshot(SnapshotRequest{"BTCUSDT", exchange, std::nullopt});

        ASSERT_TRUE(result.is_err()) << exchange;
        EXPECT_EQ(result.error().kind, ErrorKind::NoTickerData) << exchange;
        EXPECT_EQ(http_status(result.error().kind), 502) << exchange;
    }
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(SnapshotServiceTest, UnsupportedExchange) {
    auto result = service_->snapshot(SnapshotRequest{"BTCUSDT", "kraken", std::nullopt});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::UnsupportedExchange);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(SnapshotServiceTest, InvalidSymbolMakesNoNetworkCall) {
    auto result = service_->snapshot(SnapshotRequest{"ETH-BTC", "binance", std::nullopt});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidSymbol);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(SnapshotServiceTest, MissingAdapterIsUnsupported) {
    SnapshotService service(venues::VenueRegistry{}, cache_, Venue::Okx);

    auto result = service.snapshot(SnapshotRequest{"BTCUSDT", std::nullopt, std::nullopt});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::UnsupportedExchange);
}

TEST_F(SnapshotServiceTest, ConcurrentRequests) {
    transport_->respond("/api/v5/market/ticker", 200, kOkxTicker);
    transport_->respond("/v5/market/tickers", 200, kBybitTicker);

    std::vector<std::thread> threads;
    std::atomic<int> successes{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            const char* exchange = (i % 2 == 0) ? "okx" : "bybit";
            const char* symbol = (i % 2 == 0) ? "BTCUSDT" : "SOLUSDT";
            auto result = service_->snapshot(SnapshotRequest{symbol, exchange, std::nullopt});
            if (result.is_ok()) {
                ++successes;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 8);
    EXPECT_EQ(cache_->size(), 2u);
}
