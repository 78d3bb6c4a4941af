#include "config.hpp"
#include "logger.hpp"
#include "http_server.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: statik [options]\n"
              << "Serves the current directory over HTTP.\n"
              << "Options:\n"
              << "  -p, --port <port>      Listening port (default: 8080)\n"
              << "  -c, --config <path>    Optional YAML config file\n"
              << "  -h, --help             Show this help\n"
              << "\nEnvironment variables:\n"
              << "  HTTP_PORT              Listening port\n"
              << "  SERVER_ROOT            Directory to serve instead of the working directory\n"
              << "  LOG_LEVEL              Log level (trace/debug/info/warn/error)\n";
}

static void print_config(const statik::AppConfig& cfg) {
    spdlog::info("statik v{}", STATIK_VERSION);
    spdlog::info("  Root            : {}", cfg.server.root);
    spdlog::info("  Port            : {}", cfg.server.port);
    spdlog::info("  Workers         : {} (queue: {})",
                 cfg.server.worker_threads, cfg.server.queue_capacity);
    spdlog::info("  Idle timeout    : {}",
                 cfg.server.idle_timeout_s > 0 ? std::to_string(cfg.server.idle_timeout_s) + " s" : "none");
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments and load configuration ───────────────────────────────
    statik::AppConfig config;
    try {
        statik::CommandLine cl = statik::parse_command_line(argc, argv);
        if (cl.show_help) {
            print_usage();
            return 0;
        }
        if (!cl.config_path.empty()) {
            config = statik::load_config(cl.config_path);
        }
        statik::apply_env_overrides(config);
        if (cl.port) {
            config.server.port = *cl.port;
        }
        config.server.root = statik::canonical_root(config.server.root);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    try {
        statik::init_logger(config.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "ERROR: Failed to initialize logging: " << e.what() << std::endl;
        return 1;
    }
    print_config(config);

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ─── Start server ─────────────────────────────────────────────────────────
    statik::HttpServer http_server(config.server);
    if (!http_server.start()) {
        spdlog::critical("Failed to start HTTP server on port {}", config.server.port);
        return 1;
    }

    // ─── Main loop ────────────────────────────────────────────────────────────
    auto last_stats_time = std::chrono::steady_clock::now();
    constexpr auto stats_interval = std::chrono::seconds(60);

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= stats_interval) {
            last_stats_time = now;

            auto stats = http_server.get_stats();
            spdlog::info("Health: {} connections accepted | {} requests | {} active | {} queued",
                         stats.connections_accepted, stats.requests_served,
                         stats.active_connections, stats.queued_connections);
        }
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    http_server.stop();
    spdlog::info("Shutdown complete");

    return 0;
}
