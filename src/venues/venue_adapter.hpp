#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include "market/raw_readings.hpp"
#include "network/http_transport.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace prism::venues {

/// One exchange's REST surface: endpoint paths, envelope, field names
///
/// fetch() issues the ticker call on the calling thread and the funding-rate
/// and open-interest calls concurrently beside it. Only the ticker is
/// mandatory: a failed secondary call leaves its fields empty. A ticker
/// without a usable last price fails with NoTickerData.
class VenueAdapter {
public:
    virtual ~VenueAdapter() = default;

    // Non-copyable, non-movable
    VenueAdapter(const VenueAdapter&) = delete;
    VenueAdapter& operator=(const VenueAdapter&) = delete;

    [[nodiscard]] virtual Venue venue() const noexcept = 0;

    /// Collect raw readings for a venue instrument id
    /// @return readings, or the ticker call's failure (NoTickerData when
    ///         the ticker carries no parsable last price)
    [[nodiscard]] Result<RawVenueReadings, Error> fetch(const std::string& instrument_id);

protected:
    explicit VenueAdapter(std::shared_ptr<network::HttpTransport> transport);

    /// last_price, open_24h, quote_volume_24h, exchange_timestamp
    [[nodiscard]] virtual Result<RawVenueReadings, Error>
    fetch_ticker(const std::string& instrument_id) = 0;

    /// funding_rate
    [[nodiscard]] virtual Result<RawVenueReadings, Error>
    fetch_funding_rate(const std::string& instrument_id) = 0;

    /// open_interest, open_interest_unit
    [[nodiscard]] virtual Result<RawVenueReadings, Error>
    fetch_open_interest(const std::string& instrument_id) = 0;

    /// GET and parse a JSON body
    /// Transport failures and non-200 statuses give UpstreamTransportError,
    /// an unparsable body gives UpstreamSemanticError
    [[nodiscard]] Result<nlohmann::json, Error> get_json(
        const network::Endpoint& endpoint,
        const std::string& target
    );

private:
    std::shared_ptr<network::HttpTransport> transport_;
};

}  // namespace prism::venues
