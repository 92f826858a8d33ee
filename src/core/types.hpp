#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace prism {

// High-resolution timestamp for cache ageing
using Timestamp = std::chrono::steady_clock::time_point;

// Wall clock time for external display
using WallTime = std::chrono::system_clock::time_point;

// Milliseconds since the Unix epoch, as venues report them
using EpochMillis = std::int64_t;

/// Exchanges the engine knows how to query
enum class Venue {
    Okx,
    Binance,
    Bybit
};

constexpr std::array<Venue, 3> kAllVenues = {Venue::Okx, Venue::Binance, Venue::Bybit};

/// Quote currency every supported instrument is priced in
constexpr std::string_view kQuoteCurrency = "USDT";

/// Lowercase label used in responses and cache keys
[[nodiscard]] constexpr std::string_view venue_label(Venue venue) noexcept {
    switch (venue) {
        case Venue::Okx:     return "okx";
        case Venue::Binance: return "binance";
        case Venue::Bybit:   return "bybit";
    }
    return "unknown";
}

/// Name used in log lines and error details
[[nodiscard]] constexpr std::string_view venue_display_name(Venue venue) noexcept {
    switch (venue) {
        case Venue::Okx:     return "OKX";
        case Venue::Binance: return "Binance";
        case Venue::Bybit:   return "Bybit";
    }
    return "Unknown";
}

/// Case-insensitive match of a free-text label against the known venues
/// Surrounding whitespace is ignored
[[nodiscard]] std::optional<Venue> parse_venue(std::string_view label);

/// Venue-specific view of a caller-supplied symbol, built once per request
struct InstrumentRef {
    std::string raw_symbol;           // trimmed, uppercase
    Venue venue;
    std::string venue_instrument_id;  // e.g. "BTC-USDT-SWAP" on OKX
};

}  // namespace prism
