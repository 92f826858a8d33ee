#pragma once

#include "network/http_transport.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>

namespace prism::network {

/// Blocking HttpTransport over RestClient
/// Each call drives its own io_context on the calling thread, so concurrent
/// calls from different threads never share socket state
class HttpsTransport : public HttpTransport {
public:
    /// @param timeout Deadline applied to every request
    /// @param ssl_ctx Shared TLS context (created with defaults when null)
    explicit HttpsTransport(
        std::chrono::milliseconds timeout,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx = nullptr
    );

    [[nodiscard]] Result<HttpResponse, std::string> get(
        const Endpoint& endpoint,
        const std::string& target
    ) override;

private:
    std::chrono::milliseconds timeout_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
};

}  // namespace prism::network
