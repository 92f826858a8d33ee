#include "service/snapshot_service.hpp"
#include "core/text.hpp"
#include "market/reconciler.hpp"
#include "market/symbol_normalizer.hpp"
#include <spdlog/spdlog.h>

namespace prism {

namespace {

bool is_blank(const std::optional<std::string>& value) {
    return !value || text::trim(*value).empty();
}

}  // namespace

SnapshotService::SnapshotService(
    venues::VenueRegistry registry,
    std::shared_ptr<SnapshotCache> cache,
    Venue default_venue
)
    : registry_(std::move(registry))
    , cache_(std::move(cache))
    , default_venue_(default_venue)
{}

Result<Venue, Error> SnapshotService::resolve_venue(const std::optional<std::string>& exchange) const {
    if (is_blank(exchange)) {
        return Result<Venue, Error>::Ok(default_venue_);
    }
    if (auto venue = parse_venue(*exchange)) {
        return Result<Venue, Error>::Ok(*venue);
    }
    return Result<Venue, Error>::Err(Error::unsupported_exchange(
        "Unsupported exchange '" + *exchange + "' (expected okx, binance or bybit)."));
}

Result<MarketSnapshot, Error> SnapshotService::snapshot(const SnapshotRequest& request) {
    auto venue = resolve_venue(request.exchange);
    if (venue.is_err()) {
        return Result<MarketSnapshot, Error>::Err(venue.error());
    }

    auto instrument = SymbolNormalizer::make_instrument(request.symbol, venue.value());
    if (instrument.is_err()) {
        return Result<MarketSnapshot, Error>::Err(instrument.error());
    }
    const InstrumentRef& ref = instrument.value();

    // The caller's label is echoed and keyed verbatim
    const std::string exchange_label = is_blank(request.exchange)
        ? std::string(venue_label(ref.venue))
        : *request.exchange;

    const CacheKey key{exchange_label, ref.venue_instrument_id, request.timeframe.value_or("")};
    if (auto cached = cache_->get(key)) {
        spdlog::debug("Cache hit: {}:{}:{}", key.exchange, key.instrument_id, key.timeframe);
        return Result<MarketSnapshot, Error>::Ok(std::move(*cached));
    }

    auto adapter = registry_.find(ref.venue);
    if (!adapter) {
        return Result<MarketSnapshot, Error>::Err(Error::unsupported_exchange(
            "No adapter configured for " + std::string(venue_display_name(ref.venue))));
    }

    spdlog::debug("Cache miss, fetching {} {}", venue_display_name(ref.venue), ref.venue_instrument_id);
    auto readings = adapter->fetch(ref.venue_instrument_id);
    if (readings.is_err()) {
        spdlog::warn("Snapshot failed for {} on {}: [{}] {}",
                     ref.venue_instrument_id, venue_display_name(ref.venue),
                     to_string(readings.error().kind), readings.error().detail);
        return Result<MarketSnapshot, Error>::Err(readings.error());
    }

    SnapshotIdentity identity{
        ref.raw_symbol,
        exchange_label,
        std::string(venue_label(ref.venue)),
        ref.venue_instrument_id
    };
    MarketSnapshot snapshot = SnapshotReconciler::reconcile(identity, readings.value());

    cache_->put(key, snapshot);
    return Result<MarketSnapshot, Error>::Ok(std::move(snapshot));
}

}  // namespace prism
