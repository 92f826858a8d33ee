#pragma once

#include "server/routes.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace prism::server {

class HttpSession;

/// HTTP/1.1 server for the snapshot endpoints
/// Socket I/O runs on one io_context thread; request handling (which blocks
/// on upstream venues) runs on a worker pool so slow venues never stall
/// accepts or other connections
class HttpServer {
public:
    using tcp = boost::asio::ip::tcp;

    /// Create an HTTP server
    /// @param address Listen address (e.g., "0.0.0.0")
    /// @param port Port to listen on
    /// @param worker_threads Size of the request worker pool
    /// @param router Request router, must outlive the server
    HttpServer(std::string address, std::uint16_t port, std::size_t worker_threads, Router& router);

    ~HttpServer();

    // Non-copyable, non-movable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and launch the I/O thread
    /// Throws boost::system::system_error when the address cannot be bound
    void start();

    /// Stop accepting, drop connections and join all threads
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /// Port actually bound (differs from the requested one when that was 0)
    [[nodiscard]] std::uint16_t bound_port() const noexcept;

private:
    friend class HttpSession;

    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);

    std::string address_;
    std::uint16_t port_;
    Router& router_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    boost::asio::thread_pool workers_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
};

/// One client connection; serves requests until the peer stops keep-alive
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using tcp = boost::asio::ip::tcp;

    HttpSession(tcp::socket socket, HttpServer& server);

    void start();

private:
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void handle_request();
    void do_write(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res);
    void on_write(bool keep_alive, boost::system::error_code ec, std::size_t bytes_transferred);
    void do_close();

    boost::beast::tcp_stream stream_;
    HttpServer& server_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
};

}  // namespace prism::server
