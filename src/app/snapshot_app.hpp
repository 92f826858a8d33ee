#pragma once

#include "cache/snapshot_cache.hpp"
#include "core/config.hpp"
#include "server/http_server.hpp"
#include "server/routes.hpp"
#include "service/snapshot_service.hpp"
#include <atomic>
#include <memory>

namespace prism {

/// Wires transport, adapters, cache, service and HTTP server together
/// and owns their lifetimes
class SnapshotApp {
public:
    /// Build every component from config
    /// Throws std::runtime_error when the config cannot be used
    explicit SnapshotApp(const Config& config);

    ~SnapshotApp();

    // Non-copyable, non-movable
    SnapshotApp(const SnapshotApp&) = delete;
    SnapshotApp& operator=(const SnapshotApp&) = delete;

    /// Serve until shutdown is requested (blocks)
    void run();

    /// Request graceful shutdown; safe from a signal handler
    void request_shutdown() noexcept;

    [[nodiscard]] bool shutdown_requested() const noexcept;

private:
    static void setup_logging(const std::string& level);

    const Config config_;
    std::shared_ptr<SnapshotCache> cache_;
    std::unique_ptr<SnapshotService> service_;
    std::unique_ptr<server::Router> router_;
    std::unique_ptr<server::HttpServer> http_server_;

    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace prism
