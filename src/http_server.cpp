#include "http_server.hpp"
#include "http_connection.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace statik {

HttpServer::HttpServer(const ServerConfig& config)
    : config_(config)
    , handler_(config.root)
    , pool_(config.worker_threads, config.queue_capacity,
            [this](int fd) { handle_client(fd); })
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        spdlog::warn("HTTP: Failed to set SO_REUSEADDR: {}", std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(config_.port);

    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to port {}: {}", config_.port, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, SOMAXCONN) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, (sockaddr*)&bound, &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    pool_.start();
    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this);
    spdlog::info("HTTP server listening on http://0.0.0.0:{} (root: {}, workers: {})",
                 bound_port_, config_.root, pool_.worker_count());
    return true;
}

void HttpServer::stop() {
    bool was_running = running_.exchange(false);
    if (server_fd_ >= 0) {
        // Wakes the accept() in server_thread
        shutdown(server_fd_, SHUT_RDWR);
    }
    pool_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
    if (was_running) {
        spdlog::info("HTTP server stopped");
    }
}

HttpServer::Stats HttpServer::get_stats() const {
    Stats stats;
    stats.connections_accepted = connections_accepted_.load();
    stats.requests_served = requests_served_.load();
    stats.active_connections = pool_.active();
    stats.queued_connections = pool_.queued();
    return stats;
}

void HttpServer::server_thread() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, (sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno == EMFILE || errno == ENFILE) {
                spdlog::warn("HTTP: Accept failed: {}, backing off", std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            } else if (errno != EINTR) {
                spdlog::debug("HTTP: Accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        connections_accepted_.fetch_add(1);
        apply_timeouts(client_fd);

        // Blocks while every worker is busy and the queue is full
        if (!pool_.dispatch(client_fd)) {
            break;
        }
    }
}

void HttpServer::handle_client(int client_fd) {
    requests_served_.fetch_add(serve_connection(client_fd, handler_));
}

void HttpServer::apply_timeouts(int client_fd) const {
    if (config_.idle_timeout_s <= 0) {
        return;
    }
    timeval tv{};
    tv.tv_sec = config_.idle_timeout_s;
    if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        spdlog::debug("HTTP: Failed to set timeouts on fd {}: {}", client_fd, std::strerror(errno));
    }
}

} // namespace statik
