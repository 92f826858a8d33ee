#include "server/routes.hpp"
#include "core/types.hpp"

namespace prism::server {

namespace {

RouteResponse detail(int status, std::string message) {
    return RouteResponse{status, nlohmann::json{{"detail", std::move(message)}}};
}

}  // namespace

Router::Router(SnapshotService& service)
    : service_(service)
{}

RouteResponse Router::handle(boost::beast::http::verb method, std::string_view target) {
    auto parsed = network::parse_target(target);

    if (parsed.path != "/" && parsed.path != "/market_snapshot") {
        return detail(404, "Not Found");
    }
    if (method != boost::beast::http::verb::get) {
        return detail(405, "Method Not Allowed");
    }

    if (parsed.path == "/") {
        return health();
    }
    return market_snapshot(parsed);
}

RouteResponse Router::health() const {
    nlohmann::json venues = nlohmann::json::array();
    for (Venue venue : kAllVenues) {
        venues.push_back(std::string(venue_label(venue)));
    }

    return RouteResponse{200, nlohmann::json{
        {"status", "ok"},
        {"service", "crypto-market-snapshot"},
        {"source", std::string(venue_label(service_.default_venue()))},
        {"venues", std::move(venues)}
    }};
}

RouteResponse Router::market_snapshot(const network::RequestTarget& target) {
    auto symbol = target.param("symbol");
    if (!symbol) {
        return detail(400, "Missing required query parameter: symbol");
    }

    SnapshotRequest request{*symbol, target.param("exchange"), target.param("timeframe")};
    auto result = service_.snapshot(request);
    if (result.is_err()) {
        const auto& error = result.error();
        return detail(http_status(error.kind), error.detail);
    }

    return RouteResponse{200, result.value()};
}

}  // namespace prism::server
