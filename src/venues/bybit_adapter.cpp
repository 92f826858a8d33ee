#include "venues/bybit_adapter.hpp"
#include "venues/json_fields.hpp"

namespace prism::venues {

namespace {

constexpr std::string_view kTickersPath = "/v5/market/tickers";
constexpr std::string_view kFundingHistoryPath = "/v5/market/funding/history";
constexpr std::string_view kOpenInterestPath = "/v5/market/open-interest";
constexpr std::string_view kCategory = "linear";

bool is_success_code(const nlohmann::json& body) {
    const auto* code = fields::member(body, "retCode");
    if (code == nullptr) {
        return true;
    }
    if (code->is_number_integer()) {
        return code->get<long long>() == 0;
    }
    if (code->is_string()) {
        return code->get_ref<const std::string&>() == "0";
    }
    return false;
}

/// result.list[0], or nullptr
const nlohmann::json* first_result_row(const nlohmann::json& body) {
    const auto* result = fields::member(body, "result");
    if (result == nullptr) {
        return nullptr;
    }
    const auto* list = fields::member(*result, "list");
    if (list == nullptr) {
        return nullptr;
    }
    return fields::first_row(*list);
}

}  // namespace

BybitAdapter::BybitAdapter(std::shared_ptr<network::HttpTransport> transport,
                           network::Endpoint endpoint)
    : VenueAdapter(std::move(transport))
    , endpoint_(std::move(endpoint))
{}

Result<nlohmann::json, Error> BybitAdapter::get_checked(const std::string& target) {
    return get_json(endpoint_, target).and_then([](const nlohmann::json& body) {
        if (!is_success_code(body)) {
            return Result<nlohmann::json, Error>::Err(
                Error::semantic("Bybit retCode error: " + body.dump()));
        }
        return Result<nlohmann::json, Error>::Ok(body);
    });
}

Result<RawVenueReadings, Error> BybitAdapter::fetch_ticker(const std::string& instrument_id) {
    auto body = get_checked(network::build_target(
        kTickersPath, {{"category", kCategory}, {"symbol", instrument_id}}));
    if (body.is_err()) {
        return Result<RawVenueReadings, Error>::Err(body.error());
    }

    const auto* row = first_result_row(body.value());
    if (row == nullptr) {
        return Result<RawVenueReadings, Error>::Err(
            Error::no_ticker_data("No ticker data for " + instrument_id));
    }

    RawVenueReadings readings;
    readings.last_price = fields::number(*row, "lastPrice");
    readings.open_24h = fields::number(*row, "prevPrice24h");
    readings.quote_volume_24h = fields::number(*row, "turnover24h");
    // Ticker rows carry no time of their own; use the response time
    readings.exchange_timestamp = fields::text(body.value(), "time");

    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

Result<RawVenueReadings, Error> BybitAdapter::fetch_funding_rate(const std::string& instrument_id) {
    auto body = get_checked(network::build_target(
        kFundingHistoryPath,
        {{"category", kCategory}, {"symbol", instrument_id}, {"limit", "1"}}));
    if (body.is_err()) {
        return Result<RawVenueReadings, Error>::Err(body.error());
    }

    RawVenueReadings readings;
    if (const auto* row = first_result_row(body.value())) {
        readings.funding_rate = fields::number(*row, "fundingRate");
    }
    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

Result<RawVenueReadings, Error> BybitAdapter::fetch_open_interest(const std::string& instrument_id) {
    auto body = get_checked(network::build_target(
        kOpenInterestPath,
        {{"category", kCategory}, {"symbol", instrument_id}, {"intervalTime", "5min"}, {"limit", "1"}}));
    if (body.is_err()) {
        return Result<RawVenueReadings, Error>::Err(body.error());
    }

    RawVenueReadings readings;
    if (const auto* row = first_result_row(body.value())) {
        readings.open_interest = fields::number(*row, "openInterest");
        if (readings.open_interest) {
            readings.open_interest_unit = "contracts";
        }
    }
    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

}  // namespace prism::venues
