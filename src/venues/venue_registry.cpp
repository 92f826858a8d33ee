#include "venues/venue_registry.hpp"
#include "network/url.hpp"
#include "venues/binance_adapter.hpp"
#include "venues/bybit_adapter.hpp"
#include "venues/okx_adapter.hpp"

namespace prism::venues {

Result<VenueRegistry, std::string> VenueRegistry::from_config(
    const Config& config,
    std::shared_ptr<network::HttpTransport> transport
) {
    auto okx = network::parse_base_url(config.venues.okx_base);
    auto binance_spot = network::parse_base_url(config.venues.binance_spot_base);
    auto binance_futures = network::parse_base_url(config.venues.binance_futures_base);
    auto bybit = network::parse_base_url(config.venues.bybit_base);

    for (const auto* parsed : {&okx, &binance_spot, &binance_futures, &bybit}) {
        if (parsed->is_err()) {
            return Result<VenueRegistry, std::string>::Err(parsed->error());
        }
    }

    VenueRegistry registry;
    registry.add(std::make_shared<OkxAdapter>(transport, okx.value()));
    registry.add(std::make_shared<BinanceAdapter>(
        transport, binance_spot.value(), binance_futures.value()));
    registry.add(std::make_shared<BybitAdapter>(transport, bybit.value()));

    return Result<VenueRegistry, std::string>::Ok(std::move(registry));
}

void VenueRegistry::add(std::shared_ptr<VenueAdapter> adapter) {
    const Venue venue = adapter->venue();
    adapters_[venue] = std::move(adapter);
}

std::shared_ptr<VenueAdapter> VenueRegistry::find(Venue venue) const {
    auto it = adapters_.find(venue);
    if (it == adapters_.end()) {
        return nullptr;
    }
    return it->second;
}

}  // namespace prism::venues
