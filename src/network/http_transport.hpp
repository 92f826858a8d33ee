#pragma once

#include "core/status.hpp"
#include "network/url.hpp"
#include <string>

namespace prism::network {

/// Raw upstream reply; any status code, body untouched
struct HttpResponse {
    int status = 0;
    std::string body;
};

/// Blocking outbound GET used by the venue adapters
/// Implementations must be safe to call from several threads at once
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Perform a GET against endpoint + target
    /// @return the response for any HTTP status, or an error message when no
    ///         response was obtained (DNS, connect, TLS, timeout)
    [[nodiscard]] virtual Result<HttpResponse, std::string> get(
        const Endpoint& endpoint,
        const std::string& target
    ) = 0;
};

}  // namespace prism::network
