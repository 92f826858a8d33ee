#pragma once

#include "core/types.hpp"
#include "market/snapshot.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

namespace prism {

/// Cache key: caller's exchange label (verbatim), venue instrument id, timeframe
/// Two labels that resolve to the same venue are distinct keys
struct CacheKey {
    std::string exchange;
    std::string instrument_id;
    std::string timeframe;  // empty when the request carried none

    friend bool operator<(const CacheKey& a, const CacheKey& b) {
        return std::tie(a.exchange, a.instrument_id, a.timeframe) <
               std::tie(b.exchange, b.instrument_id, b.timeframe);
    }
    friend bool operator==(const CacheKey&, const CacheKey&) = default;
};

/// Short-lived memo of reconciled snapshots
/// Entries expire lazily: a lookup that finds a stale entry erases it.
/// Thread-safe; values are handed out by copy.
class SnapshotCache {
public:
    using Clock = std::function<Timestamp()>;

    static constexpr std::chrono::seconds kDefaultTtl{8};

    /// @param ttl Maximum age of a served entry
    /// @param clock Time source, steady_clock::now when empty
    explicit SnapshotCache(std::chrono::steady_clock::duration ttl = kDefaultTtl,
                           Clock clock = {});

    // Non-copyable, non-movable
    SnapshotCache(const SnapshotCache&) = delete;
    SnapshotCache& operator=(const SnapshotCache&) = delete;

    /// Fresh entry for key, or nullopt (absent or older than the TTL)
    [[nodiscard]] std::optional<MarketSnapshot> get(const CacheKey& key);

    /// Store snapshot under key, replacing any entry and restarting its age
    void put(const CacheKey& key, MarketSnapshot snapshot);

    /// Number of stored entries, stale ones included until looked up
    [[nodiscard]] std::size_t size() const;

    void clear();

    [[nodiscard]] std::chrono::steady_clock::duration ttl() const noexcept;

private:
    struct Entry {
        MarketSnapshot value;
        Timestamp stored_at;
    };

    std::chrono::steady_clock::duration ttl_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<CacheKey, Entry> entries_;
};

}  // namespace prism
