#include "server/http_server.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <spdlog/spdlog.h>

namespace prism::server {

namespace http = boost::beast::http;

namespace {

// Idle limit while waiting for a request or flushing a response
constexpr std::chrono::seconds kIoTimeout{30};

}  // namespace

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(std::string address, std::uint16_t port, std::size_t worker_threads,
                       Router& router)
    : address_(std::move(address))
    , port_(port)
    , router_(router)
    , acceptor_(ioc_)
    , workers_(worker_threads)
{}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        bound_port_ = acceptor_.local_endpoint().port();

        spdlog::info("HTTP server listening on {}:{}", address_, bound_port_.load());

        do_accept();

        io_thread_ = std::thread([this]() {
            ioc_.run();
        });

    } catch (const std::exception& e) {
        spdlog::error("Failed to start HTTP server: {}", e.what());
        running_ = false;
        throw;
    }
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    spdlog::info("HTTP server stopping");

    boost::system::error_code ec;
    acceptor_.close(ec);

    ioc_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    // In-flight requests finish; their replies go nowhere
    workers_.join();
}

bool HttpServer::is_running() const noexcept {
    return running_.load();
}

std::uint16_t HttpServer::bound_port() const noexcept {
    return bound_port_.load();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        }
    );
}

void HttpServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (ec) {
        if (running_) {
            spdlog::warn("Accept error: {}", ec.message());
        }
    } else {
        std::make_shared<HttpSession>(std::move(socket), *this)->start();
    }

    if (running_) {
        do_accept();
    }
}

// ============================================================================
// HttpSession
// ============================================================================

HttpSession::HttpSession(tcp::socket socket, HttpServer& server)
    : stream_(std::move(socket))
    , server_(server)
{}

void HttpSession::start() {
    do_read();
}

void HttpSession::do_read() {
    req_ = {};
    stream_.expires_after(kIoTimeout);

    http::async_read(
        stream_,
        buffer_,
        req_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void HttpSession::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return do_close();
    }
    if (ec) {
        if (ec != boost::beast::error::timeout) {
            spdlog::debug("HTTP read error: {}", ec.message());
        }
        return;
    }

    handle_request();
}

void HttpSession::handle_request() {
    // Upstream calls may take seconds; hand off to the worker pool
    stream_.expires_never();

    boost::asio::post(
        server_.workers_,
        [self = shared_from_this()]() {
            const auto target = self->req_.target();
            const std::string target_text(target.data(), target.size());
            const auto method = self->req_.method_string();

            const auto started = std::chrono::steady_clock::now();
            RouteResponse route = self->server_.router_.handle(self->req_.method(), target_text);
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);

            spdlog::info("{} {} -> {} ({}ms)",
                         std::string(method.data(), method.size()),
                         target_text,
                         route.status, elapsed.count());

            auto res = std::make_shared<http::response<http::string_body>>(
                static_cast<http::status>(route.status), self->req_.version());
            res->set(http::field::server, "prism/1.0");
            res->set(http::field::content_type, "application/json");
            res->keep_alive(self->req_.keep_alive());
            res->body() = route.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            res->prepare_payload();

            // Socket work goes back to the I/O thread
            boost::asio::post(
                self->stream_.get_executor(),
                [self, res]() {
                    self->do_write(res);
                }
            );
        }
    );
}

void HttpSession::do_write(std::shared_ptr<http::response<http::string_body>> res) {
    stream_.expires_after(kIoTimeout);
    const bool keep_alive = res->keep_alive();

    http::async_write(
        stream_,
        *res,
        [self = shared_from_this(), res, keep_alive](auto ec, auto bytes) {
            self->on_write(keep_alive, ec, bytes);
        }
    );
}

void HttpSession::on_write(bool keep_alive, boost::system::error_code ec,
                           std::size_t /*bytes_transferred*/) {
    if (ec) {
        spdlog::debug("HTTP write error: {}", ec.message());
        return;
    }

    if (!keep_alive) {
        return do_close();
    }

    do_read();
}

void HttpSession::do_close() {
    boost::system::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace prism::server
