#pragma once

#include "network/url.hpp"
#include "service/snapshot_service.hpp"
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>
#include <string_view>

namespace prism::server {

/// Status code and JSON body produced for one request
struct RouteResponse {
    int status = 200;
    nlohmann::json body;
};

/// Maps request targets onto the snapshot service
///   GET /                  liveness payload
///   GET /market_snapshot   ?symbol=BTCUSDT[&exchange=okx][&timeframe=4H]
/// Errors carry a {"detail": "..."} body
class Router {
public:
    explicit Router(SnapshotService& service);

    /// Route a request; never throws for client input
    [[nodiscard]] RouteResponse handle(boost::beast::http::verb method, std::string_view target);

private:
    [[nodiscard]] RouteResponse health() const;
    [[nodiscard]] RouteResponse market_snapshot(const network::RequestTarget& target);

    SnapshotService& service_;
};

}  // namespace prism::server
