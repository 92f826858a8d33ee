#pragma once

#include "network/url.hpp"
#include "venues/venue_adapter.hpp"

namespace prism::venues {

/// Bybit v5 public API, linear (USDT-margined) contracts
/// Envelope: {"retCode": 0, "retMsg": "OK", "result": {"list": [...]}, "time": ms}
class BybitAdapter : public VenueAdapter {
public:
    BybitAdapter(std::shared_ptr<network::HttpTransport> transport, network::Endpoint endpoint);

    [[nodiscard]] Venue venue() const noexcept override { return Venue::Bybit; }

protected:
    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_ticker(const std::string& instrument_id) override;

    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_funding_rate(const std::string& instrument_id) override;

    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_open_interest(const std::string& instrument_id) override;

private:
    /// GET and check retCode; returns the whole body
    [[nodiscard]] Result<nlohmann::json, Error> get_checked(const std::string& target);

    network::Endpoint endpoint_;
};

}  // namespace prism::venues
