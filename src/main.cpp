#include "app/snapshot_app.hpp"
#include "core/config.hpp"
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

std::unique_ptr<prism::SnapshotApp> g_app;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_app) {
            g_app->request_shutdown();
        }
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>  Load configuration from JSON file\n"
              << "  -p, --port <port>    HTTP listen port\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  PRISM_OKX_BASE               OKX REST base URL\n"
              << "  PRISM_BINANCE_SPOT_BASE      Binance spot REST base URL\n"
              << "  PRISM_BINANCE_FUTURES_BASE   Binance USD-M futures REST base URL\n"
              << "  PRISM_BYBIT_BASE             Bybit REST base URL\n"
              << "  PRISM_DEFAULT_VENUE          Venue used when no exchange is given\n"
              << "  PRISM_REQUEST_TIMEOUT_MS     Per upstream call timeout\n"
              << "  PRISM_CACHE_TTL_SECONDS      Snapshot cache TTL\n"
              << "  PRISM_SERVER_ADDRESS         HTTP listen address\n"
              << "  PRISM_SERVER_PORT            HTTP listen port\n"
              << "  PRISM_WORKER_THREADS         Request worker threads\n"
              << "  PRISM_LOG_LEVEL              trace|debug|info|warn|error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "prism v1.0.0\n"
              << "Normalized market snapshots for OKX, Binance and Bybit\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::uint16_t> port;
    bool show_help = false;
    bool show_version = false;
    std::optional<std::string> error;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                int port = std::stoi(value);
                if (port < 1 || port > 65535) {
                    throw std::out_of_range(value);
                }
                args.port = static_cast<std::uint16_t>(port);
            } catch (const std::exception&) {
                args.error = "invalid port: " + value;
            }
        } else {
            args.error = "unknown argument: " + arg;
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.error) {
        std::cerr << "Error: " << *args.error << "\n" << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = prism::Config::load(args.config_path);

    if (args.port) {
        config.server.port = *args.port;
    }

    auto validated = config.validate();
    if (validated.is_err()) {
        std::cerr << "Invalid configuration: " << validated.error() << std::endl;
        return 1;
    }

    std::cout << "Configuration:\n"
              << "  Listen: " << config.server.address << ":" << config.server.port << "\n"
              << "  OKX: " << config.venues.okx_base << "\n"
              << "  Binance: " << config.venues.binance_spot_base
              << " / " << config.venues.binance_futures_base << "\n"
              << "  Bybit: " << config.venues.bybit_base << "\n"
              << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        g_app = std::make_unique<prism::SnapshotApp>(config);
        g_app->run();
        g_app.reset();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
