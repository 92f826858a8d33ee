#include <benchmark/benchmark.h>
#include "cache/snapshot_cache.hpp"
#include <string>
#include <vector>

using namespace prism;

namespace {

MarketSnapshot make_snapshot(const std::string& instrument_id) {
    MarketSnapshot snapshot;
    snapshot.symbol = "BTCUSDT";
    snapshot.exchange = "okx";
    snapshot.source = "okx";
    snapshot.instrument_id = instrument_id;
    snapshot.price = 65000.0;
    snapshot.timestamp = "2024-05-01T12:00:00Z";
    return snapshot;
}

std::vector<CacheKey> make_keys(std::size_t count) {
    std::vector<CacheKey> keys;
    keys.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        keys.push_back(CacheKey{"okx", "SYM" + std::to_string(i) + "-USDT-SWAP", ""});
    }
    return keys;
}

}  // namespace

// Benchmark cache hit lookup with a populated cache
static void BM_CacheHit(benchmark::State& state) {
    SnapshotCache cache(std::chrono::hours(1));
    auto keys = make_keys(static_cast<std::size_t>(state.range(0)));
    for (const auto& key : keys) {
        cache.put(key, make_snapshot(key.instrument_id));
    }

    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(cache.get(keys[i]));
        i = (i + 1) % keys.size();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CacheHit)->Range(8, 4096);

// Benchmark cache miss lookup
static void BM_CacheMiss(benchmark::State& state) {
    SnapshotCache cache(std::chrono::hours(1));
    for (const auto& key : make_keys(256)) {
        cache.put(key, make_snapshot(key.instrument_id));
    }
    const CacheKey absent{"bybit", "BTCUSDT", ""};

    for (auto _ : state) {
        benchmark::DoNotOptimize(cache.get(absent));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CacheMiss);

// Benchmark overwriting an existing entry
static void BM_CachePut(benchmark::State& state) {
    SnapshotCache cache(std::chrono::hours(1));
    const CacheKey key{"okx", "BTC-USDT-SWAP", ""};
    const auto snapshot = make_snapshot(key.instrument_id);

    for (auto _ : state) {
        cache.put(key, snapshot);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CachePut);

// Benchmark contended lookups from several threads
static void BM_CacheHitContended(benchmark::State& state) {
    static SnapshotCache cache(std::chrono::hours(1));
    static const auto keys = make_keys(64);
    if (state.thread_index() == 0) {
        for (const auto& key : keys) {
            cache.put(key, make_snapshot(key.instrument_id));
        }
    }

    std::size_t i = static_cast<std::size_t>(state.thread_index());
    for (auto _ : state) {
        benchmark::DoNotOptimize(cache.get(keys[i % keys.size()]));
        ++i;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CacheHitContended)->Threads(1)->Threads(4);

BENCHMARK_MAIN();
