#include "venues/binance_adapter.hpp"
#include "venues/json_fields.hpp"

namespace prism::venues {

namespace {

constexpr std::string_view kTickerPath = "/api/v3/ticker/24hr";
constexpr std::string_view kPremiumIndexPath = "/fapi/v1/premiumIndex";
constexpr std::string_view kOpenInterestPath = "/fapi/v1/openInterest";

/// The 24hr endpoint answers with an object, or a list when queried in bulk
const nlohmann::json* ticker_row(const nlohmann::json& body) {
    if (body.is_object()) {
        return &body;
    }
    return fields::first_row(body);
}

}  // namespace

BinanceAdapter::BinanceAdapter(std::shared_ptr<network::HttpTransport> transport,
                               network::Endpoint spot_endpoint,
                               network::Endpoint futures_endpoint)
    : VenueAdapter(std::move(transport))
    , spot_endpoint_(std::move(spot_endpoint))
    , futures_endpoint_(std::move(futures_endpoint))
{}

Result<RawVenueReadings, Error> BinanceAdapter::fetch_ticker(const std::string& instrument_id) {
    auto body = get_json(spot_endpoint_,
                         network::build_target(kTickerPath, {{"symbol", instrument_id}}));
    if (body.is_err()) {
        return Result<RawVenueReadings, Error>::Err(body.error());
    }

    const auto* row = ticker_row(body.value());
    if (row == nullptr) {
        return Result<RawVenueReadings, Error>::Err(
            Error::no_ticker_data("No ticker data for " + instrument_id));
    }

    RawVenueReadings readings;
    readings.last_price = fields::number(*row, "lastPrice");
    readings.open_24h = fields::number(*row, "openPrice");
    readings.quote_volume_24h = fields::number(*row, "quoteVolume");
    readings.exchange_timestamp = fields::text(*row, "closeTime");

    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

Result<RawVenueReadings, Error> BinanceAdapter::fetch_funding_rate(const std::string& instrument_id) {
    auto body = get_json(futures_endpoint_,
                         network::build_target(kPremiumIndexPath, {{"symbol", instrument_id}}));
    if (body.is_err()) {
        return Result<RawVenueReadings, Error>::Err(body.error());
    }

    RawVenueReadings readings;
    readings.funding_rate = fields::number(body.value(), "lastFundingRate");
    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

Result<RawVenueReadings, Error> BinanceAdapter::fetch_open_interest(const std::string& instrument_id) {
    auto body = get_json(futures_endpoint_,
                         network::build_target(kOpenInterestPath, {{"symbol", instrument_id}}));
    if (body.is_err()) {
        return Result<RawVenueReadings, Error>::Err(body.error());
    }

    RawVenueReadings readings;
    readings.open_interest = fields::number(body.value(), "openInterest");
    if (readings.open_interest) {
        readings.open_interest_unit = "contracts";
    }
    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

}  // namespace prism::venues
