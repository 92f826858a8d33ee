#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <string>
#include <string_view>

namespace prism {

/// Maps venue-agnostic symbols ("BTCUSDT") to venue instrument ids
/// Each venue has its own rule; formats differ structurally, not cosmetically
class SymbolNormalizer {
public:
    /// Validate and convert a symbol for the given venue
    /// Fails with InvalidSymbol when the trimmed, uppercased input is empty,
    /// contains anything but [A-Z0-9], or lacks a base before the USDT suffix
    [[nodiscard]] static Result<std::string, Error>
    normalize(std::string_view raw_symbol, Venue venue);

    /// normalize() packaged as an InstrumentRef
    [[nodiscard]] static Result<InstrumentRef, Error>
    make_instrument(std::string_view raw_symbol, Venue venue);

    /// Trimmed, uppercased form echoed back in snapshots
    [[nodiscard]] static std::string canonical_symbol(std::string_view raw_symbol);

private:
    [[nodiscard]] static Result<std::string, Error> validate(std::string_view raw_symbol);

    /// "BTCUSDT" -> "BTC-USDT-SWAP" (perpetual swap)
    [[nodiscard]] static std::string okx_instrument(const std::string& symbol);

    /// Binance and Bybit list linear contracts under the plain symbol
    [[nodiscard]] static std::string passthrough_instrument(const std::string& symbol);
};

}  // namespace prism
