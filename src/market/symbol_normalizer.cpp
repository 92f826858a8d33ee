#include "market/symbol_normalizer.hpp"
#include "core/text.hpp"
#include <algorithm>
#include <cctype>

namespace prism {

std::string SymbolNormalizer::canonical_symbol(std::string_view raw_symbol) {
    return text::to_uppercase(text::trim(raw_symbol));
}

Result<std::string, Error> SymbolNormalizer::validate(std::string_view raw_symbol) {
    std::string symbol = canonical_symbol(raw_symbol);

    if (symbol.empty()) {
        return Result<std::string, Error>::Err(
            Error::invalid_symbol("Invalid symbol format: symbol is empty."));
    }

    bool alphanumeric = std::all_of(symbol.begin(), symbol.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
    if (!alphanumeric) {
        return Result<std::string, Error>::Err(
            Error::invalid_symbol("Invalid symbol format: '" + symbol + "'."));
    }

    if (!symbol.ends_with(kQuoteCurrency) || symbol.size() == kQuoteCurrency.size()) {
        return Result<std::string, Error>::Err(Error::invalid_symbol(
            "Only *USDT symbols supported (e.g., BTCUSDT), got '" + symbol + "'."));
    }

    return Result<std::string, Error>::Ok(std::move(symbol));
}

std::string SymbolNormalizer::okx_instrument(const std::string& symbol) {
    std::string base = symbol.substr(0, symbol.size() - kQuoteCurrency.size());
    return base + "-" + std::string(kQuoteCurrency) + "-SWAP";
}

std::string SymbolNormalizer::passthrough_instrument(const std::string& symbol) {
    return symbol;
}

Result<std::string, Error> SymbolNormalizer::normalize(std::string_view raw_symbol, Venue venue) {
    return validate(raw_symbol).map([venue](const std::string& symbol) {
        switch (venue) {
            case Venue::Okx:
                return okx_instrument(symbol);
            case Venue::Binance:
            case Venue::Bybit:
                return passthrough_instrument(symbol);
        }
        return symbol;
    });
}

Result<InstrumentRef, Error> SymbolNormalizer::make_instrument(std::string_view raw_symbol,
                                                               Venue venue) {
    return normalize(raw_symbol, venue).map([&](const std::string& instrument_id) {
        return InstrumentRef{canonical_symbol(raw_symbol), venue, instrument_id};
    });
}

}  // namespace prism
