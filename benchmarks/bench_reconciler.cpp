#include <benchmark/benchmark.h>
#include "market/reconciler.hpp"
#include "market/symbol_normalizer.hpp"
#include "venues/json_fields.hpp"
#include <random>

using namespace prism;

// Benchmark reconciliation of a fully populated reading set
static void BM_ReconcileFull(benchmark::State& state) {
    SnapshotIdentity identity{"BTCUSDT", "okx", "okx", "BTC-USDT-SWAP"};
    RawVenueReadings readings;
    readings.last_price = 65000.0;
    readings.open_24h = 64000.0;
    readings.quote_volume_24h = 1'200'000'000.0;
    readings.funding_rate = 0.0001;
    readings.open_interest = 5'000'000'000.0;
    readings.open_interest_unit = "USD";
    readings.exchange_timestamp = "1714564800000";
    const WallTime now = std::chrono::system_clock::now();

    for (auto _ : state) {
        benchmark::DoNotOptimize(SnapshotReconciler::reconcile(identity, readings, now));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ReconcileFull);

// Benchmark the classification heuristics over random inputs
static void BM_Classify(benchmark::State& state) {
    std::mt19937 rng(42);
    std::normal_distribution<double> change_dist(0.0, 4.0);
    std::lognormal_distribution<double> volume_dist(18.0, 1.5);

    for (auto _ : state) {
        benchmark::DoNotOptimize(SnapshotReconciler::classify_volatility(change_dist(rng)));
        benchmark::DoNotOptimize(SnapshotReconciler::classify_liquidity(volume_dist(rng)));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Classify);

// Benchmark snapshot serialization
static void BM_SnapshotToJson(benchmark::State& state) {
    SnapshotIdentity identity{"ETHUSDT", "binance", "binance", "ETHUSDT"};
    RawVenueReadings readings;
    readings.last_price = 3000.0;
    readings.open_24h = 3100.0;
    readings.quote_volume_24h = 80'000'000.0;
    auto snapshot = SnapshotReconciler::reconcile(identity, readings);

    for (auto _ : state) {
        nlohmann::json j = snapshot;
        benchmark::DoNotOptimize(j.dump());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SnapshotToJson);

// Benchmark symbol normalization per venue
static void BM_NormalizeSymbol(benchmark::State& state) {
    const auto venue = static_cast<Venue>(state.range(0));

    for (auto _ : state) {
        benchmark::DoNotOptimize(SymbolNormalizer::normalize(" btcusdt ", venue));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_NormalizeSymbol)->DenseRange(0, 2);

// Benchmark lenient field extraction from a venue ticker row
static void BM_ParseTickerRow(benchmark::State& state) {
    const auto row = nlohmann::json::parse(
        R"({"instId":"BTC-USDT-SWAP","last":"65000.1","open24h":"64000.2",
            "volCcyQuote":"","volCcy24h":"1200000000.5","ts":"1714564800000"})");

    for (auto _ : state) {
        benchmark::DoNotOptimize(venues::fields::number(row, "last"));
        benchmark::DoNotOptimize(venues::fields::number(row, "open24h"));
        benchmark::DoNotOptimize(
            venues::fields::first_number(row, {"volCcyQuote", "volCcy24h", "volCcy"}));
        benchmark::DoNotOptimize(venues::fields::text(row, "ts"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ParseTickerRow);

BENCHMARK_MAIN();
