#include "venues/venue_adapter.hpp"
#include <future>
#include <spdlog/spdlog.h>

namespace prism::venues {

namespace {

// Upstream payloads embedded in error details are cut to this length
constexpr std::size_t kMaxDetailBody = 512;

std::string truncate_body(const std::string& body) {
    if (body.size() <= kMaxDetailBody) {
        return body;
    }
    return body.substr(0, kMaxDetailBody) + "...";
}

}  // namespace

VenueAdapter::VenueAdapter(std::shared_ptr<network::HttpTransport> transport)
    : transport_(std::move(transport))
{}

Result<RawVenueReadings, Error> VenueAdapter::fetch(const std::string& instrument_id) {
    auto funding_future = std::async(std::launch::async, [this, &instrument_id]() {
        return fetch_funding_rate(instrument_id);
    });
    auto open_interest_future = std::async(std::launch::async, [this, &instrument_id]() {
        return fetch_open_interest(instrument_id);
    });

    auto ticker = fetch_ticker(instrument_id);
    auto funding = funding_future.get();
    auto open_interest = open_interest_future.get();

    if (ticker.is_err()) {
        return ticker;
    }

    RawVenueReadings readings = std::move(ticker).value();
    const auto venue_name = venue_display_name(venue());

    // Missing and unparsable prices are treated alike on every venue
    if (!readings.last_price) {
        return Result<RawVenueReadings, Error>::Err(
            Error::no_ticker_data("No ticker data for " + instrument_id));
    }

    if (funding.is_ok()) {
        readings.funding_rate = funding.value().funding_rate;
    } else {
        spdlog::warn("{} funding rate unavailable for {}: {}",
                     venue_name, instrument_id, funding.error().detail);
    }

    if (open_interest.is_ok()) {
        readings.open_interest = open_interest.value().open_interest;
        readings.open_interest_unit = open_interest.value().open_interest_unit;
    } else {
        spdlog::warn("{} open interest unavailable for {}: {}",
                     venue_name, instrument_id, open_interest.error().detail);
    }

    return Result<RawVenueReadings, Error>::Ok(std::move(readings));
}

Result<nlohmann::json, Error> VenueAdapter::get_json(
    const network::Endpoint& endpoint,
    const std::string& target
) {
    const auto venue_name = std::string(venue_display_name(venue()));

    auto response = transport_->get(endpoint, target);
    if (response.is_err()) {
        return Result<nlohmann::json, Error>::Err(
            Error::transport(venue_name + " upstream error: " + response.error()));
    }

    const auto& reply = response.value();
    if (reply.status != 200) {
        return Result<nlohmann::json, Error>::Err(Error::transport(
            venue_name + " upstream error: HTTP " + std::to_string(reply.status) +
            ": " + truncate_body(reply.body)));
    }

    try {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::parse(reply.body));
    } catch (const nlohmann::json::exception& e) {
        return Result<nlohmann::json, Error>::Err(Error::semantic(
            venue_name + " returned malformed JSON: " + std::string(e.what())));
    }
}

}  // namespace prism::venues
