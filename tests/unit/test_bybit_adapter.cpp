#include <gtest/gtest.h>
#include "support/fake_transport.hpp"
#include "venues/bybit_adapter.hpp"

using namespace prism;
using namespace prism::venues;
using prism::test_support::FakeTransport;

class BybitAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<FakeTransport>();
        adapter_ = std::make_unique<BybitAdapter>(
            transport_, network::Endpoint{"api.bybit.com", "443", ""});
    }

    std::shared_ptr<FakeTransport> transport_;
    std::unique_ptr<BybitAdapter> adapter_;
};

TEST_F(BybitAdapterTest, FetchMergesAllThreeCalls) {
    transport_->respond("/v5/market/tickers", 200,
                        R"({"retCode":0,"retMsg":"OK","result":{"category":"linear","list":[
                            {"symbol":"SOLUSDT","lastPrice":"150.5","prevPrice24h":"140",
                             "turnover24h":"350000000"}]},"time":1714564800000})");
    transport_->respond("/v5/market/funding/history", 200,
                        R"({"retCode":0,"result":{"list":[{"fundingRate":"-0.0002"}]}})");
    transport_->respond("/v5/market/open-interest", 200,
                        R"({"retCode":0,"result":{"list":[{"openInterest":"123456.7"}]}})");

    auto result = adapter_->fetch("SOLUSDT");

    ASSERT_TRUE(result.is_ok());
    const auto& r = result.value();
    EXPECT_EQ(r.last_price, 150.5);
    EXPECT_EQ(r.open_24h, 140.0);
    EXPECT_EQ(r.quote_volume_24h, 350'000'000.0);
    EXPECT_EQ(r.exchange_timestamp, "1714564800000");
    EXPECT_EQ(r.funding_rate, -0.0002);
    EXPECT_EQ(r.open_interest, 123456.7);
    EXPECT_EQ(r.open_interest_unit, "contracts");
}

TEST_F(BybitAdapterTest, RequestTargets) {
    (void)adapter_->fetch("SOLUSDT");

    EXPECT_EQ(transport_->target_of("/v5/market/tickers"),
              "/v5/market/tickers?category=linear&symbol=SOLUSDT");
    EXPECT_EQ(transport_->target_of("/v5/market/funding/history"),
              "/v5/market/funding/history?category=linear&symbol=SOLUSDT&limit=1");
    EXPECT_EQ(transport_->target_of("/v5/market/open-interest"),
              "/v5/market/open-interest?category=linear&symbol=SOLUSDT&intervalTime=5min&limit=1");
}

TEST_F(BybitAdapterTest, NonZeroRetCodeIsSemanticError) {
    transport_->respond("/v5/market/tickers", 200,
                        R"({"retCode":10001,"retMsg":"params error","result":{}})");

    auto result = adapter_->fetch("FOOUSDT");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::UpstreamSemanticError);
    EXPECT_NE(result.error().detail.find("10001"), std::string::npos);
}

TEST_F(BybitAdapterTest, EmptyListIsNoTickerData) {
    transport_->respond("/v5/market/tickers", 200,
                        R"({"retCode":0,"result":{"category":"linear","list":[]}})");

    auto result = adapter_->fetch("FOOUSDT");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::NoTickerData);
}

TEST_F(BybitAdapterTest, SecondaryFailuresLeaveFieldsEmpty) {
    transport_->respond("/v5/market/tickers", 200,
                        R"({"retCode":0,"result":{"list":[{"lastPrice":"150"}]}})");
    transport_->fail("/v5/market/funding/history", "timeout after 12000ms during read");
    transport_->respond("/v5/market/open-interest", 200, R"({"retCode":"0","result":{"list":[]}})");

    auto result = adapter_->fetch("SOLUSDT");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().last_price, 150.0);
    EXPECT_FALSE(result.value().funding_rate);
    EXPECT_FALSE(result.value().open_interest);
    EXPECT_FALSE(result.value().exchange_timestamp);
}

TEST_F(BybitAdapterTest, MissingLastPriceIsNoTickerData) {
    transport_->respond("/v5/market/tickers", 200,
                        R"({"retCode":0,"result":{"list":[{"prevPrice24h":"100"}]}})");

    auto result = adapter_->fetch("SOLUSDT");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::NoTickerData);
}

TEST_F(BybitAdapterTest, UnparsableLastPriceIsNoTickerData) {
    transport_->respond("/v5/market/tickers", 200,
                        R"({"retCode":0,"result":{"list":[{"lastPrice":"abc","prevPrice24h":"100"}]}})");

    auto result = adapter_->fetch("SOLUSDT");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::NoTickerData);
}
