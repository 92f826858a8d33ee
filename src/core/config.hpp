#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace prism {

/// Immutable configuration for prism, read once at process start
struct Config {
    /// Upstream venue endpoints
    struct Venues {
        std::string okx_base = "https://www.okx.com";
        std::string binance_spot_base = "https://api.binance.com";
        std::string binance_futures_base = "https://fapi.binance.com";
        std::string bybit_base = "https://api.bybit.com";

        // Venue used when a request carries no exchange label
        std::string default_venue = "okx";

        // Bound on every individual upstream call
        std::chrono::milliseconds request_timeout{12000};
    };

    /// Snapshot cache configuration
    struct Cache {
        std::chrono::seconds ttl{8};
    };

    /// Inbound HTTP server configuration
    struct Server {
        std::string address = "0.0.0.0";
        std::uint16_t port = 8080;
        std::size_t worker_threads = 4;
    };

    /// Logging configuration
    struct Logging {
        std::string level = "info";
    };

    Venues venues;
    Cache cache;
    Server server;
    Logging logging;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Check values that parse fine but cannot be used
    /// (non-https base URL, unknown default venue)
    /// @return the config itself, or a description of the first problem found
    [[nodiscard]] Result<Config, std::string> validate() const;

    /// Resolved default venue (okx when default_venue names nothing known)
    [[nodiscard]] Venue default_venue() const;
};

}  // namespace prism
