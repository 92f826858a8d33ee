#pragma once

#include <optional>
#include <string>

namespace prism {

/// Values pulled out of one venue fetch before reconciliation
/// Every field is optional: venues differ in what they expose and omit
/// fields for illiquid instruments
struct RawVenueReadings {
    std::optional<double> last_price;
    std::optional<double> open_24h;
    std::optional<double> quote_volume_24h;
    std::optional<double> funding_rate;
    std::optional<double> open_interest;
    std::optional<std::string> open_interest_unit;  // "USD" or "contracts"
    std::optional<std::string> exchange_timestamp;  // epoch millis as reported

    friend bool operator==(const RawVenueReadings&, const RawVenueReadings&) = default;
};

}  // namespace prism
