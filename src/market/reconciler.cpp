#include "market/reconciler.hpp"
#include "core/time_format.hpp"
#include <cmath>

namespace prism {

std::optional<double> SnapshotReconciler::price_change_percent(
    std::optional<double> last,
    std::optional<double> open
) {
    if (!last || !open || *open == 0.0) {
        return std::nullopt;
    }
    return (*last - *open) / *open * 100.0;
}

std::optional<VolatilityRegime> SnapshotReconciler::classify_volatility(
    std::optional<double> price_change_percent
) {
    if (!price_change_percent) {
        return std::nullopt;
    }

    double magnitude = std::abs(*price_change_percent);
    if (magnitude < kLowVolatilityBelow) {
        return VolatilityRegime::Low;
    }
    if (magnitude < kMediumVolatilityBelow) {
        return VolatilityRegime::Medium;
    }
    return VolatilityRegime::High;
}

std::optional<LiquidityCondition> SnapshotReconciler::classify_liquidity(
    std::optional<double> quote_volume
) {
    if (!quote_volume) {
        return std::nullopt;
    }

    double volume = *quote_volume;
    if (volume <= 0.0 || volume < kThinLiquidityBelow) {
        return LiquidityCondition::Thin;
    }
    if (volume < kNormalLiquidityBelow) {
        return LiquidityCondition::Normal;
    }
    return LiquidityCondition::Crowded;
}

MarketSnapshot SnapshotReconciler::reconcile(
    const SnapshotIdentity& identity,
    const RawVenueReadings& readings,
    WallTime now
) {
    MarketSnapshot snapshot;
    snapshot.symbol = identity.symbol;
    snapshot.exchange = identity.exchange;
    snapshot.source = identity.source;
    snapshot.instrument_id = identity.instrument_id;

    snapshot.price = readings.last_price;
    snapshot.price_change_24h = price_change_percent(readings.last_price, readings.open_24h);
    snapshot.volume_24h = readings.quote_volume_24h;

    snapshot.funding_rate = readings.funding_rate;
    snapshot.open_interest = readings.open_interest;
    // A unit without a value means nothing
    if (readings.open_interest) {
        snapshot.open_interest_unit = readings.open_interest_unit;
    }

    snapshot.volatility_regime = classify_volatility(snapshot.price_change_24h);
    snapshot.liquidity_condition = classify_liquidity(snapshot.volume_24h);

    if (readings.exchange_timestamp) {
        snapshot.timestamp_exchange = time_format::millis_to_iso8601(*readings.exchange_timestamp);
    }
    snapshot.timestamp = time_format::iso8601(now);

    return snapshot;
}

MarketSnapshot SnapshotReconciler::reconcile(
    const SnapshotIdentity& identity,
    const RawVenueReadings& readings
) {
    return reconcile(identity, readings, std::chrono::system_clock::now());
}

}  // namespace prism
