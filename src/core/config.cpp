#include "core/config.hpp"
#include "network/url.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace prism {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (value) {
        try {
            int result = std::stoi(*value);
            if (result < min_val || result > max_val) {
                std::cerr << "Warning: " << name << " value " << result
                          << " out of range [" << min_val << ", " << max_val
                          << "], ignoring" << std::endl;
                return std::nullopt;
            }
            return result;
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid integer value for " << name
                      << ": " << *value << ", ignoring" << std::endl;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Venue endpoints
    if (auto v = get_env("PRISM_OKX_BASE")) {
        config.venues.okx_base = *v;
    }
    if (auto v = get_env("PRISM_BINANCE_SPOT_BASE")) {
        config.venues.binance_spot_base = *v;
    }
    if (auto v = get_env("PRISM_BINANCE_FUTURES_BASE")) {
        config.venues.binance_futures_base = *v;
    }
    if (auto v = get_env("PRISM_BYBIT_BASE")) {
        config.venues.bybit_base = *v;
    }
    if (auto v = get_env("PRISM_DEFAULT_VENUE")) {
        config.venues.default_venue = *v;
    }
    // Upstream timeout: 1s to 60s
    if (auto v = get_env_int("PRISM_REQUEST_TIMEOUT_MS", 1000, 60000)) {
        config.venues.request_timeout = std::chrono::milliseconds(*v);
    }

    // Cache TTL: 0 (effectively disabled) to 1 hour
    if (auto v = get_env_int("PRISM_CACHE_TTL_SECONDS", 0, 3600)) {
        config.cache.ttl = std::chrono::seconds(*v);
    }

    // Server
    if (auto v = get_env("PRISM_SERVER_ADDRESS")) {
        config.server.address = *v;
    }
    // Port range: 1024-65535 (non-privileged ports)
    if (auto v = get_env_int("PRISM_SERVER_PORT", 1024, 65535)) {
        config.server.port = static_cast<std::uint16_t>(*v);
    }
    if (auto v = get_env_int("PRISM_WORKER_THREADS", 1, 64)) {
        config.server.worker_threads = static_cast<std::size_t>(*v);
    }

    if (auto v = get_env("PRISM_LOG_LEVEL")) {
        config.logging.level = *v;
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    json j;
    try {
        j = json::parse(content);
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("venues")) {
            const auto& ven = j["venues"];
            if (ven.contains("okx_base")) {
                config.venues.okx_base = ven["okx_base"].get<std::string>();
            }
            if (ven.contains("binance_spot_base")) {
                config.venues.binance_spot_base = ven["binance_spot_base"].get<std::string>();
            }
            if (ven.contains("binance_futures_base")) {
                config.venues.binance_futures_base = ven["binance_futures_base"].get<std::string>();
            }
            if (ven.contains("bybit_base")) {
                config.venues.bybit_base = ven["bybit_base"].get<std::string>();
            }
            if (ven.contains("default_venue")) {
                config.venues.default_venue = ven["default_venue"].get<std::string>();
            }
            if (ven.contains("request_timeout_ms")) {
                config.venues.request_timeout =
                    std::chrono::milliseconds(ven["request_timeout_ms"].get<int>());
            }
        }

        if (j.contains("cache")) {
            const auto& cache = j["cache"];
            if (cache.contains("ttl_seconds")) {
                config.cache.ttl = std::chrono::seconds(cache["ttl_seconds"].get<int>());
            }
        }

        if (j.contains("server")) {
            const auto& srv = j["server"];
            if (srv.contains("address")) {
                config.server.address = srv["address"].get<std::string>();
            }
            if (srv.contains("port")) {
                config.server.port = srv["port"].get<std::uint16_t>();
            }
            if (srv.contains("worker_threads")) {
                config.server.worker_threads = srv["worker_threads"].get<std::size_t>();
            }
        }

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                config.logging.level = log["level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    // Environment variables have the final say
    apply_env_overrides(config);

    return config;
}

Result<Config, std::string> Config::validate() const {
    const std::pair<const char*, const std::string*> bases[] = {
        {"okx_base", &venues.okx_base},
        {"binance_spot_base", &venues.binance_spot_base},
        {"binance_futures_base", &venues.binance_futures_base},
        {"bybit_base", &venues.bybit_base},
    };
    for (const auto& [name, url] : bases) {
        auto parsed = network::parse_base_url(*url);
        if (parsed.is_err()) {
            return Result<Config, std::string>::Err(
                std::string("venues.") + name + ": " + parsed.error());
        }
    }

    if (!parse_venue(venues.default_venue)) {
        return Result<Config, std::string>::Err(
            "venues.default_venue: unknown venue '" + venues.default_venue + "'");
    }
    if (venues.request_timeout.count() <= 0) {
        return Result<Config, std::string>::Err("venues.request_timeout_ms must be positive");
    }
    if (cache.ttl.count() < 0) {
        return Result<Config, std::string>::Err("cache.ttl_seconds must not be negative");
    }
    if (server.worker_threads == 0) {
        return Result<Config, std::string>::Err("server.worker_threads must be at least 1");
    }

    return Result<Config, std::string>::Ok(*this);
}

Venue Config::default_venue() const {
    return parse_venue(venues.default_venue).value_or(Venue::Okx);
}

}  // namespace prism
