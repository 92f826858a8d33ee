#include "network/ssl_context.hpp"
#include <openssl/ssl.h>

namespace prism::network {

std::shared_ptr<boost::asio::ssl::context> create_ssl_context(bool verify_peer) {
    auto ctx = std::make_shared<boost::asio::ssl::context>(
        boost::asio::ssl::context::tls_client
    );

    ctx->set_options(
        boost::asio::ssl::context::default_workarounds |
        boost::asio::ssl::context::no_sslv2 |
        boost::asio::ssl::context::no_sslv3 |
        boost::asio::ssl::context::no_tlsv1 |
        boost::asio::ssl::context::no_tlsv1_1
    );
    SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_2_VERSION);

    ctx->set_default_verify_paths();
    ctx->set_verify_mode(verify_peer ? boost::asio::ssl::verify_peer
                                     : boost::asio::ssl::verify_none);

    return ctx;
}

}  // namespace prism::network
