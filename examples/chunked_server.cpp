/**
 * @file chunked_server.cpp
 * @brief Resumable chunked upload server
 *
 * USAGE:
 *   chunked_server [--config server.json] [--port 8080]
 *                  [--artifacts ./uploads] [--staging ./uploads/chunks]
 *                  [--log-level info]
 *
 * Try:
 *   curl -X POST localhost:8080/api/upload/status \
 *        -d '{"fingerprint":"abc","artifact_name":"a.bin"}'
 *   curl localhost:8080/api/stats
 */

#include "chunked/core/config.hpp"
#include "chunked/events/components.hpp"
#include "chunked/events/event_bus.hpp"
#include "chunked/network/http_router.hpp"
#include "chunked/network/http_server_asio.hpp"
#include "chunked/server/http_api.hpp"
#include "chunked/server/upload_service.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;

using chunked::ServerConfig;
using chunked::events::EventBus;
using chunked::events::LoggerComponent;
using chunked::events::MetricsComponent;
using chunked::events::ServerShuttingDownEvent;
using chunked::events::ServerStartedEvent;
using chunked::network::HttpRouter;
using chunked::network::HttpServerAsio;
using chunked::network::ServerOptions;
using chunked::server::UploadService;

namespace {

void print_usage(const char* program) {
    spdlog::info("Usage: {} [--config file] [--port n] [--artifacts dir] [--staging dir] [--log-level level]",
                 program);
}

/**
 * @brief Periodic staging sweep on an Asio timer
 */
class SweepTimer {
public:
    SweepTimer(asio::io_context& io, UploadService& service, std::chrono::milliseconds interval)
        : timer_(io), service_(service), interval_(interval) {}

    void start() {
        timer_.expires_after(interval_);
        timer_.async_wait([this](boost::system::error_code ec) {
            if (ec) {
                return;
            }
            auto swept = service_.sweep_staging();
            if (swept.is_error()) {
                spdlog::error("Staging sweep failed: {}", swept.error().message);
            } else if (swept.value() > 0) {
                spdlog::info("Staging sweep removed {} orphaned chunk set(s)", swept.value());
            }
            start();
        });
    }

    void cancel() { timer_.cancel(); }

private:
    asio::steady_timer timer_;
    UploadService& service_;
    std::chrono::milliseconds interval_;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    // --config first, so flags can override the file
    ServerConfig config;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            auto loaded = chunked::load_server_config(argv[i + 1]);
            if (loaded.is_error()) {
                spdlog::error("{}", loaded.error().message);
                return EXIT_FAILURE;
            }
            config = loaded.value();
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--artifacts" && i + 1 < argc) {
            config.artifacts_root = fs::path(argv[++i]);
        } else if (arg == "--staging" && i + 1 < argc) {
            config.staging_root = fs::path(argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            spdlog::error("Unknown argument: {}", arg);
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (auto level = chunked::apply_log_level(config.log_level); level.is_error()) {
        spdlog::error("{}", level.error().message);
        return EXIT_FAILURE;
    }

    EventBus event_bus;
    LoggerComponent logger(event_bus);
    MetricsComponent metrics(event_bus);

    UploadService service(config, event_bus);
    if (auto ready = service.initialize(); ready.is_error()) {
        spdlog::error("Cannot initialise storage: {}", ready.error().message);
        return EXIT_FAILURE;
    }

    HttpRouter router;
    chunked::server::register_upload_routes(router, service, &metrics);

    spdlog::info("Registered routes:");
    for (const auto& route : router.list_routes()) {
        spdlog::info("  {}", route);
    }

    ServerOptions options;
    options.worker_threads = config.worker_threads;
    options.max_body_bytes = config.max_json_body_bytes;
    options.request_timeout = config.request_timeout;

    try {
        asio::io_context io_context;

        HttpServerAsio server(io_context, config.port, router, options);
        SweepTimer sweeper(io_context, service, config.sweep_interval);
        sweeper.start();

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](boost::system::error_code ec, int signal) {
            if (ec) {
                return;
            }
            event_bus.emit(ServerShuttingDownEvent{signal == SIGINT ? "SIGINT" : "SIGTERM"});
            sweeper.cancel();
            io_context.stop();
        });

        event_bus.emit(ServerStartedEvent{server.get_port()});
        spdlog::info("Artifacts: {}  Staging: {}", config.artifacts_root.string(), config.staging_root.string());
        spdlog::info("Press Ctrl+C to stop");

        const auto io_threads = std::max<std::size_t>(1, config.io_threads);
        std::vector<std::thread> threads;
        for (std::size_t i = 1; i < io_threads; ++i) {
            threads.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& thread : threads) {
            thread.join();
        }

        server.stop();
        metrics.print_stats();
        spdlog::info("Server shut down cleanly");
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
