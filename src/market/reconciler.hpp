#pragma once

#include "core/types.hpp"
#include "market/raw_readings.hpp"
#include "market/snapshot.hpp"
#include <optional>
#include <string>

namespace prism {

/// Identity fields copied verbatim into the snapshot
struct SnapshotIdentity {
    std::string symbol;
    std::string exchange;
    std::string source;
    std::string instrument_id;
};

/// Merges raw venue readings into a MarketSnapshot
/// Pure: no I/O, the generation time is passed in
class SnapshotReconciler {
public:
    // Volatility cutoffs on |price_change_24h| (percent)
    static constexpr double kLowVolatilityBelow = 2.0;
    static constexpr double kMediumVolatilityBelow = 5.0;

    // Liquidity cutoffs on 24h quote notional
    static constexpr double kThinLiquidityBelow = 50'000'000.0;
    static constexpr double kNormalLiquidityBelow = 300'000'000.0;

    [[nodiscard]] static MarketSnapshot reconcile(
        const SnapshotIdentity& identity,
        const RawVenueReadings& readings,
        WallTime now
    );

    /// reconcile() stamped with the current system time
    [[nodiscard]] static MarketSnapshot reconcile(
        const SnapshotIdentity& identity,
        const RawVenueReadings& readings
    );

    /// (last - open) / open * 100, only when both exist and open != 0
    [[nodiscard]] static std::optional<double> price_change_percent(
        std::optional<double> last,
        std::optional<double> open
    );

    /// <2 low, <5 medium, otherwise high
    [[nodiscard]] static std::optional<VolatilityRegime> classify_volatility(
        std::optional<double> price_change_percent
    );

    /// <=0 or <50M thin, <300M normal, otherwise crowded
    [[nodiscard]] static std::optional<LiquidityCondition> classify_liquidity(
        std::optional<double> quote_volume
    );
};

}  // namespace prism
