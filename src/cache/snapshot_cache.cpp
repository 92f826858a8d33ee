#include "cache/snapshot_cache.hpp"
#include <spdlog/spdlog.h>

namespace prism {

SnapshotCache::SnapshotCache(std::chrono::steady_clock::duration ttl, Clock clock)
    : ttl_(ttl)
    , clock_(clock ? std::move(clock) : Clock{[] { return std::chrono::steady_clock::now(); }})
{}

std::optional<MarketSnapshot> SnapshotCache::get(const CacheKey& key) {
    const Timestamp now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    if (now - it->second.stored_at > ttl_) {
        spdlog::debug("Cache entry expired: {}:{}:{}",
                      key.exchange, key.instrument_id, key.timeframe);
        entries_.erase(it);
        return std::nullopt;
    }

    return it->second.value;
}

void SnapshotCache::put(const CacheKey& key, MarketSnapshot snapshot) {
    const Timestamp now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(key, Entry{std::move(snapshot), now});
}

std::size_t SnapshotCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void SnapshotCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::chrono::steady_clock::duration SnapshotCache::ttl() const noexcept {
    return ttl_;
}

}  // namespace prism
