#pragma once

#include "network/url.hpp"
#include "venues/venue_adapter.hpp"

namespace prism::venues {

/// OKX v5 public API, perpetual swaps ("BTC-USDT-SWAP")
/// Envelope: {"code": "0", "msg": "", "data": [...]}
class OkxAdapter : public VenueAdapter {
public:
    OkxAdapter(std::shared_ptr<network::HttpTransport> transport, network::Endpoint endpoint);

    [[nodiscard]] Venue venue() const noexcept override { return Venue::Okx; }

protected:
    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_ticker(const std::string& instrument_id) override;

    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_funding_rate(const std::string& instrument_id) override;

    [[nodiscard]] Result<RawVenueReadings, Error>
    fetch_open_interest(const std::string& instrument_id) override;

private:
    /// GET and unwrap the envelope; returns the "data" array (empty if absent)
    [[nodiscard]] Result<nlohmann::json, Error> get_data(const std::string& target);

    network::Endpoint endpoint_;
};

}  // namespace prism::venues
