#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace prism::network {

/// Create a TLS client context (TLS 1.2 minimum, system trust store)
/// Shared by every outbound request; OpenSSL contexts are safe to share
/// across threads once configured
/// @param verify_peer Verify the venue certificate chain
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_ssl_context(bool verify_peer = true);

}  // namespace prism::network
