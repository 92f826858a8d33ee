#pragma once

#include "cache/snapshot_cache.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include "market/snapshot.hpp"
#include "venues/venue_registry.hpp"
#include <memory>
#include <optional>
#include <string>

namespace prism {

/// Inputs of one snapshot request
struct SnapshotRequest {
    std::string symbol;                    // required, free text
    std::optional<std::string> exchange;   // venue label; default venue when empty
    std::optional<std::string> timeframe;  // cache discriminator only
};

/// Orchestrates one snapshot request:
/// resolve venue -> normalize -> cache lookup -> (fetch -> reconcile -> store)
///
/// Only successful reconciliations are cached. There is no retry here; a
/// failure is reported once.
class SnapshotService {
public:
    /// @param registry Adapters available for fetching
    /// @param cache Shared snapshot cache
    /// @param default_venue Venue used when a request names no exchange
    SnapshotService(
        venues::VenueRegistry registry,
        std::shared_ptr<SnapshotCache> cache,
        Venue default_venue = Venue::Okx
    );

    // Non-copyable, non-movable
    SnapshotService(const SnapshotService&) = delete;
    SnapshotService& operator=(const SnapshotService&) = delete;

    /// Produce a snapshot (thread-safe)
    [[nodiscard]] Result<MarketSnapshot, Error> snapshot(const SnapshotRequest& request);

    [[nodiscard]] Venue default_venue() const noexcept { return default_venue_; }

private:
    [[nodiscard]] Result<Venue, Error> resolve_venue(const std::optional<std::string>& exchange) const;

    venues::VenueRegistry registry_;
    std::shared_ptr<SnapshotCache> cache_;
    Venue default_venue_;
};

}  // namespace prism
