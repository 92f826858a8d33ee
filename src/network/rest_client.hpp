#pragma once

#include "core/status.hpp"
#include "network/http_transport.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace prism::network {

/// Async HTTPS client for a single REST GET
/// One instance per request; the whole exchange (resolve through read) is
/// bounded by one deadline
class RestClient : public std::enable_shared_from_this<RestClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using ssl_stream = boost::asio::ssl::stream<tcp::socket>;

    /// Called exactly once with the response (any status) or a transport error
    using ResponseHandler = std::function<void(Result<HttpResponse, std::string>)>;

    /// Create a new REST client
    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    /// @param timeout Deadline for the complete request
    RestClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::chrono::milliseconds timeout
    );

    ~RestClient();

    // Non-copyable, non-movable
    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    /// Perform an async GET request
    /// @param host Hostname (e.g., "www.okx.com")
    /// @param port Port (e.g., "443")
    /// @param target Path with query (e.g., "/api/v5/market/ticker?instId=BTC-USDT-SWAP")
    /// @param handler Callback with response or error
    void get(
        std::string_view host,
        std::string_view port,
        std::string_view target,
        ResponseHandler handler
    );

private:
    void start_deadline();
    void on_deadline(boost::system::error_code ec);
    void do_resolve();
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void do_ssl_handshake();
    void on_ssl_handshake(boost::system::error_code ec);
    void do_write();
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_shutdown();
    void on_shutdown(boost::system::error_code ec);
    void fail(const std::string& what, boost::system::error_code ec);
    void complete(Result<HttpResponse, std::string> result);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    tcp::resolver resolver_;
    boost::asio::steady_timer deadline_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<ssl_stream> stream_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;

    std::string host_;
    std::string port_;
    std::string target_;
    ResponseHandler handler_;
    bool completed_{false};
    bool timed_out_{false};
};

}  // namespace prism::network
