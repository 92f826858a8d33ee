#include "network/rest_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

// Helper to set SNI hostname without old-style cast warning
namespace {
inline bool set_sni_hostname(SSL* ssl, const char* hostname) {
    // SSL_set_tlsext_host_name is a macro with old-style cast
    return SSL_ctrl(ssl, SSL_CTRL_SET_TLSEXT_HOSTNAME,
                    TLSEXT_NAMETYPE_host_name,
                    const_cast<char*>(hostname)) != 0;
}
}  // namespace

namespace prism::network {

RestClient::RestClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    std::chrono::milliseconds timeout
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , resolver_(ioc)
    , deadline_(ioc)
    , timeout_(timeout)
{}

RestClient::~RestClient() {
    if (stream_) {
        boost::system::error_code ec;
        stream_->lowest_layer().close(ec);
    }
}

void RestClient::get(
    std::string_view host,
    std::string_view port,
    std::string_view target,
    ResponseHandler handler
) {
    host_ = std::string(host);
    port_ = std::string(port);
    target_ = std::string(target);
    handler_ = std::move(handler);

    spdlog::debug("REST GET https://{}:{}{}", host_, port_, target_);

    start_deadline();
    do_resolve();
}

void RestClient::start_deadline() {
    deadline_.expires_after(timeout_);
    deadline_.async_wait(
        [self = shared_from_this()](boost::system::error_code ec) {
            self->on_deadline(ec);
        }
    );
}

void RestClient::on_deadline(boost::system::error_code ec) {
    if (ec == boost::asio::error::operation_aborted) {
        return;  // Cancelled after completion
    }

    // Abort whatever stage is in flight; its handler reports the failure
    timed_out_ = true;
    resolver_.cancel();
    if (stream_) {
        boost::system::error_code close_ec;
        stream_->lowest_layer().close(close_ec);
    }
}

void RestClient::do_resolve() {
    resolver_.async_resolve(
        host_,
        port_,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void RestClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    // The deadline may have fired after this stage finished but before its
    // handler ran; nothing was left to cancel then
    if (timed_out_) {
        return fail("resolve", boost::asio::error::timed_out);
    }
    if (ec) {
        return fail("resolve", ec);
    }

    stream_ = std::make_unique<ssl_stream>(ioc_, *ssl_ctx_);

    if (!set_sni_hostname(stream_->native_handle(), host_.c_str())) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail("ssl_sni", ssl_ec);
    }
    stream_->set_verify_callback(boost::asio::ssl::host_name_verification(host_));

    // Try every resolved address in turn
    boost::asio::async_connect(
        stream_->next_layer(),
        results,
        [self = shared_from_this()](auto connect_ec, const auto& /*endpoint*/) {
            self->on_connect(connect_ec);
        }
    );
}

void RestClient::on_connect(boost::system::error_code ec) {
    if (timed_out_) {
        return fail("connect", boost::asio::error::timed_out);
    }
    if (ec) {
        return fail("connect", ec);
    }

    do_ssl_handshake();
}

void RestClient::do_ssl_handshake() {
    stream_->async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void RestClient::on_ssl_handshake(boost::system::error_code ec) {
    if (timed_out_) {
        return fail("ssl_handshake", boost::asio::error::timed_out);
    }
    if (ec) {
        return fail("ssl_handshake", ec);
    }

    req_.method(boost::beast::http::verb::get);
    req_.target(target_);
    req_.version(11);
    req_.set(boost::beast::http::field::host, host_);
    req_.set(boost::beast::http::field::user_agent, "prism/1.0");
    req_.set(boost::beast::http::field::accept, "application/json");

    do_write();
}

void RestClient::do_write() {
    boost::beast::http::async_write(
        *stream_,
        req_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void RestClient::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("write", ec);
    }

    do_read();
}

void RestClient::do_read() {
    boost::beast::http::async_read(
        *stream_,
        buffer_,
        res_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void RestClient::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("read", ec);
    }

    HttpResponse response;
    response.status = static_cast<int>(res_.result_int());
    response.body = std::move(res_.body());

    if (response.status != 200) {
        spdlog::warn("REST {}{} returned HTTP {}", host_, target_, response.status);
    } else {
        spdlog::debug("REST response: {} bytes", response.body.size());
    }

    complete(Result<HttpResponse, std::string>::Ok(std::move(response)));
    do_shutdown();
}

void RestClient::do_shutdown() {
    stream_->async_shutdown(
        [self = shared_from_this()](auto ec) {
            self->on_shutdown(ec);
        }
    );
}

void RestClient::on_shutdown(boost::system::error_code ec) {
    // SSL shutdown errors are common and can be ignored
    if (ec && ec != boost::asio::error::eof &&
        ec != boost::asio::ssl::error::stream_truncated) {
        spdlog::debug("SSL shutdown: {}", ec.message());
    }

    deadline_.cancel();
}

void RestClient::fail(const std::string& what, boost::system::error_code ec) {
    std::string error;
    if (timed_out_) {
        error = "timeout after " + std::to_string(timeout_.count()) + "ms during " + what;
    } else {
        error = what + ": " + ec.message();
    }
    spdlog::error("REST {}{} failed: {}", host_, target_, error);

    deadline_.cancel();
    complete(Result<HttpResponse, std::string>::Err(std::move(error)));
}

void RestClient::complete(Result<HttpResponse, std::string> result) {
    if (completed_) {
        return;
    }
    completed_ = true;
    if (handler_) {
        handler_(std::move(result));
    }
}

}  // namespace prism::network
