#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>

namespace statik {

struct ServerConfig {
    uint16_t port = 8080;
    std::string root = ".";          // canonical absolute path once the server starts
    // Connection handling limits; they do not change what is served
    std::size_t worker_threads = 16;
    std::size_t queue_capacity = 64;
    int idle_timeout_s = 30;         // 0 = no read/write deadline
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

struct CommandLine {
    std::optional<uint16_t> port;
    std::string config_path;
    bool show_help = false;
};

// Parse a decimal TCP port. Throws std::invalid_argument on anything else.
uint16_t parse_port(const std::string& text);

// Recognizes -p/--port, -c/--config and -h/--help; other arguments are ignored.
// Throws std::invalid_argument for a missing or malformed option value.
CommandLine parse_command_line(int argc, const char* const argv[]);

// Load configuration from a YAML file on top of the defaults
AppConfig load_config(const std::string& path);

// HTTP_PORT, SERVER_ROOT and LOG_LEVEL take precedence over the file
void apply_env_overrides(AppConfig& cfg);

// Resolve the root directory to its canonical absolute form.
// Throws std::runtime_error if it does not exist or is not a directory.
std::string canonical_root(const std::string& root);

} // namespace statik
