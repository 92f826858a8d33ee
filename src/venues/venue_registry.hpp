#pragma once

#include "core/config.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include "network/http_transport.hpp"
#include "venues/venue_adapter.hpp"
#include <map>
#include <memory>
#include <string>

namespace prism::venues {

/// Owns one adapter per venue
class VenueRegistry {
public:
    VenueRegistry() = default;

    /// Build OKX, Binance and Bybit adapters from configured base URLs
    /// @return the registry, or a description of an unusable base URL
    [[nodiscard]] static Result<VenueRegistry, std::string> from_config(
        const Config& config,
        std::shared_ptr<network::HttpTransport> transport
    );

    /// Register (or replace) the adapter for its venue
    void add(std::shared_ptr<VenueAdapter> adapter);

    /// Adapter for venue, or nullptr when none is registered
    [[nodiscard]] std::shared_ptr<VenueAdapter> find(Venue venue) const;

    [[nodiscard]] std::size_t size() const noexcept { return adapters_.size(); }

private:
    std::map<Venue, std::shared_ptr<VenueAdapter>> adapters_;
};

}  // namespace prism::venues
