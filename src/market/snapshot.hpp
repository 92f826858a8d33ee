#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace prism {

enum class VolatilityRegime {
    Low,
    Medium,
    High
};

/// Heuristic over traded notional, not order-book depth
enum class LiquidityCondition {
    Thin,
    Normal,
    Crowded
};

[[nodiscard]] std::string_view to_string(VolatilityRegime regime) noexcept;
[[nodiscard]] std::string_view to_string(LiquidityCondition condition) noexcept;

constexpr std::string_view kVolumeUnitQuoteNotional = "quote_notional";

/// Canonical venue-agnostic market state for one instrument
struct MarketSnapshot {
    // Identity
    std::string symbol;          // uppercase, venue-agnostic
    std::string exchange;        // label as supplied by the caller
    std::string source;          // venue actually queried
    std::string instrument_id;   // venue-specific identifier

    // Pricing
    std::optional<double> price;
    std::string price_quote = "USDT";
    std::optional<double> price_change_24h;  // percent, signed

    // Volume
    std::optional<double> volume_24h;
    std::string volume_24h_unit{kVolumeUnitQuoteNotional};

    // Derivatives
    std::optional<double> funding_rate;
    std::optional<double> open_interest;
    std::optional<std::string> open_interest_unit;

    // Desk labels
    std::optional<VolatilityRegime> volatility_regime;
    std::optional<LiquidityCondition> liquidity_condition;

    // Timestamps (ISO-8601 UTC)
    std::optional<std::string> timestamp_exchange;
    std::string timestamp;

    friend bool operator==(const MarketSnapshot&, const MarketSnapshot&) = default;
};

/// JSON form served to clients
/// Empty optionals become null; oi_change and long_short_ratio are always null
void to_json(nlohmann::json& j, const MarketSnapshot& snapshot);

}  // namespace prism
