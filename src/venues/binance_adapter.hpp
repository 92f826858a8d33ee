#pragma once

#include "network/url.hpp"
#include "venues/venue_adapter.hpp"

namespace prism::venues {

/// Binance: spot ticker plus USD-M futures funding and open interest
/// No envelope; the HTTP status is the only success signal. Symbols that are
/// not listed on futures simply lose their derivatives fields.
class BinanceAdapter : public VenueAdapter {
public:
    BinanceAdapter(std::shared_ptr<network::HttpTransport> transport,
                   network::Endpoint spot_endpoint,
                   network::Endpoint futures_endpoint);

    [[nodiscard]] Venue venue() const noexcept override { return Venue::Binance; }

protected:
    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_ticker(const std::string& instrument_id) override;

    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_funding_rate(const std::string& instrument_id) override;

    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_open_interest(const std::string& instrument_id) override;

private:
    network::Endpoint spot_endpoint_;
    network::Endpoint futures_endpoint_;
};

}  // namespace prism::venues
