#include "venues/okx_adapter.hpp"
#include "venues/json_fields.hpp"

namespace prism::venues {

namespace {

constexpr std::string_view kTickerPath = "/api/v5/market/ticker";
constexpr std::string_view kFundingRatePath = "/api/v5/public/funding-rate";
constexpr std::string_view kOpenInterestPath = "/api/v5/public/open-interest";

/// OKX reports success as code "0"; a missing code is treated as success
bool is_success_code(const nlohmann::json& body) {
    const auto* code = fields::member(body, "code");
    if (code == nullptr) {
        return true;
    }
    if (code->is_string()) {
        return code->get_ref<const std::string&>() == "0";
    }
    if (code->is_number_integer()) {
        return code->get<long long>() == 0;
    }
    return false;
}

}  // namespace

OkxAdapter::OkxAdapter(std::shared_ptr<network::HttpTransport> transport,
                       network::Endpoint endpoint)
    : VenueAdapter(std::move(transport))
    , endpoint_(std::move(endpoint))
{}

Result<nlohmann::json, Error> OkxAdapter::get_data(const std::string& target) {
    return get_json(endpoint_, target).and_then([](const nlohmann::json& body) {
        if (!is_success_code(body)) {
            return Result<nlohmann::json, Error>::Err(
                Error::semantic("OKX code error: " + body.dump()));
        }
        const auto* data = fields::member(body, "data");
        if (data == nullptr || !data->is_array()) {
            return Result<nlohmann::json, Error>::Ok(nlohmann::json::array());
        }
        return Result<nlohmann::json, Error>::Ok(*data);
    });
}

Result<RawVenueReadings, Error> OkxAdapter::fetch_ticker(const std::string& instrument_id) {
    auto data = get_data(network::build_target(kTickerPath, {{"instId", instrument_id}}));
    if (data.is_err()) {
        return Result<RawVenueReadings, Error>::Err(data.error());
    }

    const auto* row = fields::first_row(data.value());
    if (row == nullptr) {
        return Result<RawVenueReadings, Error>::Err(
            Error::no_ticker_data("No ticker data for " + instrument_id));
    }

    RawVenueReadings readings;
    readings.last_price = fields::number(*row, "last");
    readings.open_24h = fields::number(*row, "open24h");
    // Quote-notional volume; which field is populated depends on the market
    readings.quote_volume_24h = fields::first_number(*row, {"volCcyQuote", "volCcy24h", "volCcy"});
    readings.exchange_timestamp = fields::text(*row, "ts");

    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

Result<RawVenueReadings, Error> OkxAdapter::fetch_funding_rate(const std::string& instrument_id) {
    auto data = get_data(network::build_target(kFundingRatePath, {{"instId", instrument_id}}));
    if (data.is_err()) {
        return Result<RawVenueReadings, Error>::Err(data.error());
    }

    RawVenueReadings readings;
    if (const auto* row = fields::first_row(data.value())) {
        readings.funding_rate = fields::number(*row, "fundingRate");
    }
    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

Result<RawVenueReadings, Error> OkxAdapter::fetch_open_interest(const std::string& instrument_id) {
    auto data = get_data(network::build_target(
        kOpenInterestPath, {{"instType", "SWAP"}, {"instId", instrument_id}}));
    if (data.is_err()) {
        return Result<RawVenueReadings, Error>::Err(data.error());
    }

    RawVenueReadings readings;
    const auto* row = fields::first_row(data.value());
    if (row == nullptr) {
        return Result<RawVenueReadings, Error>::Ok(std::move(readings));
    }

    // Prefer the USD notional; fall back to the contract count
    if (fields::is_present(*row, "oiUsd")) {
        readings.open_interest = fields::number(*row, "oiUsd");
        readings.open_interest_unit = "USD";
    } else if (fields::is_present(*row, "oi")) {
        readings.open_interest = fields::number(*row, "oi");
        readings.open_interest_unit = "contracts";
    }
    if (!readings.open_interest) {
        readings.open_interest_unit.reset();
    }

    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

}  // namespace prism::venues
