#include "app/snapshot_app.hpp"
#include "network/https_transport.hpp"
#include "venues/venue_registry.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace prism {

SnapshotApp::SnapshotApp(const Config& config)
    : config_(config)
{
    setup_logging(config_.logging.level);

    auto transport = std::make_shared<network::HttpsTransport>(config_.venues.request_timeout);

    auto registry = venues::VenueRegistry::from_config(config_, transport);
    if (registry.is_err()) {
        throw std::runtime_error("Invalid venue configuration: " + registry.error());
    }

    cache_ = std::make_shared<SnapshotCache>(config_.cache.ttl);
    service_ = std::make_unique<SnapshotService>(
        std::move(registry).value(), cache_, config_.default_venue());
    router_ = std::make_unique<server::Router>(*service_);
    http_server_ = std::make_unique<server::HttpServer>(
        config_.server.address, config_.server.port, config_.server.worker_threads, *router_);
}

SnapshotApp::~SnapshotApp() {
    request_shutdown();
    // Server first: its workers still reference the service
    http_server_.reset();
}

void SnapshotApp::setup_logging(const std::string& level) {
    // Initialize async logging to avoid blocking request threads
    spdlog::init_thread_pool(8192, 1);

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::async_logger>(
        "prism",
        stdout_sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

void SnapshotApp::run() {
    spdlog::info("Starting prism market snapshot service");
    spdlog::info("Default venue: {}, cache TTL: {}s, upstream timeout: {}ms",
                 venue_label(config_.default_venue()),
                 config_.cache.ttl.count(),
                 config_.venues.request_timeout.count());

    http_server_->start();

    while (!shutdown_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    http_server_->stop();

    spdlog::info("Service shutdown complete");
}

void SnapshotApp::request_shutdown() noexcept {
    shutdown_requested_.store(true);
}

bool SnapshotApp::shutdown_requested() const noexcept {
    return shutdown_requested_.load();
}

}  // namespace prism
