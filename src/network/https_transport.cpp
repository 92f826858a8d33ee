#include "network/https_transport.hpp"
#include "network/rest_client.hpp"
#include "network/ssl_context.hpp"
#include <boost/asio/io_context.hpp>
#include <optional>

namespace prism::network {

HttpsTransport::HttpsTransport(
    std::chrono::milliseconds timeout,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx
)
    : timeout_(timeout)
    , ssl_ctx_(ssl_ctx ? std::move(ssl_ctx) : create_ssl_context())
{}

Result<HttpResponse, std::string> HttpsTransport::get(
    const Endpoint& endpoint,
    const std::string& target
) {
    boost::asio::io_context ioc;
    std::optional<Result<HttpResponse, std::string>> outcome;

    auto client = std::make_shared<RestClient>(ioc, ssl_ctx_, timeout_);
    client->get(
        endpoint.host,
        endpoint.port,
        endpoint.base_path + target,
        [&outcome, &ioc](Result<HttpResponse, std::string> result) {
            outcome.emplace(std::move(result));
            // Skip waiting on the TLS close_notify exchange
            ioc.stop();
        }
    );

    ioc.run();

    if (!outcome) {
        return Result<HttpResponse, std::string>::Err(
            "request to " + endpoint.origin() + " ended without a response");
    }
    return std::move(*outcome);
}

}  // namespace prism::network
