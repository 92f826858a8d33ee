#include <gtest/gtest.h>
#include "server/routes.hpp"
#include "support/fake_transport.hpp"
#include "venues/okx_adapter.hpp"

using namespace prism;
using namespace prism::server;
using prism::test_support::FakeTransport;
namespace http = boost::beast::http;

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeTransport>();

        venues::VenueRegistry registry;
        registry.add(std::make_shared<venues::OkxAdapter>(
            transport_, network::Endpoint{"www.okx.com", "443", ""}));

        service_ = std::make_unique<SnapshotService>(
            std::move(registry), std::make_shared<SnapshotCache>(), Venue::Okx);
        router_ = std::make_unique<Router>(*service_);
    }

    std::shared_ptr<FakeTransport> transport_;
    std::unique_ptr<SnapshotService> service_;
    std::unique_ptr<Router> router_;
};

TEST_F(RouterTest, HealthPayload) {
    auto res = router_->handle(http::verb::get, "/");

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body["status"], "ok");
    EXPECT_EQ(res.body["service"], "crypto-market-snapshot");
    EXPECT_EQ(res.body["source"], "okx");
    EXPECT_EQ(res.body["venues"], nlohmann::json::array({"okx", "binance", "bybit"}));
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(RouterTest, SnapshotSuccess) {
    transport_->respond("/api/v5/market/ticker", 200,
                        R"({"code":"0","data":[{"last":"65000","open24h":"64000"}]})");

    auto res = router_->handle(http::verb::get, "/market_snapshot?symbol=btcusdt");

    ASSERT_EQ(res.status, 200);
    EXPECT_EQ(res.body["symbol"], "BTCUSDT");
    EXPECT_EQ(res.body["exchange"], "okx");
    EXPECT_EQ(res.body["instrument_id"], "BTC-USDT-SWAP");
    EXPECT_EQ(res.body["volatility_regime"], "low");
    EXPECT_TRUE(res.body["funding_rate"].is_null());
}

TEST_F(RouterTest, MissingSymbolIs400) {
    auto res = router_->handle(http::verb::get, "/market_snapshot");

    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(res.body["detail"], "Missing required query parameter: symbol");

    auto empty = router_->handle(http::verb::get, "/market_snapshot?symbol=");
    EXPECT_EQ(empty.status, 400);
}

TEST_F(RouterTest, InvalidSymbolIs400WithDetail) {
    auto res = router_->handle(http::verb::get, "/market_snapshot?symbol=ETHBTC");

    EXPECT_EQ(res.status, 400);
    EXPECT_NE(res.body["detail"].get<std::string>().find("USDT"), std::string::npos);
    EXPECT_EQ(transport_->call_count(), 0u);
}

TEST_F(RouterTest, UnsupportedExchangeIs400) {
    auto res = router_->handle(http::verb::get, "/market_snapshot?symbol=BTCUSDT&exchange=kraken");

    EXPECT_EQ(res.status, 400);
    EXPECT_NE(res.body["detail"].get<std::string>().find("kraken"), std::string::npos);
}

TEST_F(RouterTest, UpstreamFailureIs502) {
    transport_->respond("/api/v5/market/ticker", 500, "oops");

    auto res = router_->handle(http::verb::get, "/market_snapshot?symbol=BTCUSDT");

    EXPECT_EQ(res.status, 502);
    EXPECT_NE(res.body["detail"].get<std::string>().find("OKX"), std::string::npos);
}

TEST_F(RouterTest, UnknownPathIs404) {
    auto res = router_->handle(http::verb::get, "/nope");

    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(res.body["detail"], "Not Found");
}

TEST_F(RouterTest, NonGetIs405) {
    auto res = router_->handle(http::verb::post, "/market_snapshot?symbol=BTCUSDT");

    EXPECT_EQ(res.status, 405);
    EXPECT_EQ(res.body["detail"], "Method Not Allowed");
    EXPECT_EQ(transport_->call_count(), 0u);
}
