#pragma once

#include "config.hpp"
#include "request_handler.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace statik {

// Static file server: accept thread feeding a bounded worker pool
class HttpServer {
public:
    // config.root must already be canonical
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Bound port; differs from the configured one when that was 0
    uint16_t port() const { return bound_port_; }

    struct Stats {
        uint64_t connections_accepted = 0;
        uint64_t requests_served = 0;
        std::size_t active_connections = 0;
        std::size_t queued_connections = 0;
    };
    Stats get_stats() const;

private:
    void server_thread();
    void handle_client(int client_fd);
    void apply_timeouts(int client_fd) const;

    ServerConfig config_;
    RequestHandler handler_;
    WorkerPool pool_;

    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::atomic<uint64_t> connections_accepted_{0};
    std::atomic<uint64_t> requests_served_{0};
};

} // namespace statik
