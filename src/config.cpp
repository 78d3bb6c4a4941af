#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace statik {

static const char* env_or_null(const char* name) {
    const char* val = std::getenv(name);
    return (val && *val) ? val : nullptr;
}

uint16_t parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("invalid port: '" + text + "'");
    }
    unsigned long value = std::stoul(text);
    if (value > 65535) {
        throw std::invalid_argument("port out of range: " + text);
    }
    return static_cast<uint16_t>(value);
}

CommandLine parse_command_line(int argc, const char* const argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--port" || arg == "-p") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            cl.port = parse_port(argv[++i]);
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + arg);
            }
            cl.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            cl.show_help = true;
        }
    }
    return cl;
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        if (auto s = root["server"]) {
            if (auto port = s["port"]) {
                cfg.server.port = parse_port(port.as<std::string>());
            }
            cfg.server.root = s["root"].as<std::string>(cfg.server.root);
            cfg.server.worker_threads = s["worker_threads"].as<std::size_t>(cfg.server.worker_threads);
            cfg.server.queue_capacity = s["queue_capacity"].as<std::size_t>(cfg.server.queue_capacity);
            cfg.server.idle_timeout_s = s["idle_timeout_s"].as<int>(cfg.server.idle_timeout_s);
        }

        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config " + path + ": " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid config " + path + ": " + std::string(e.what()));
    }

    if (cfg.server.worker_threads == 0 || cfg.server.queue_capacity == 0) {
        throw std::runtime_error("Invalid config " + path +
                                 ": worker_threads and queue_capacity must be positive");
    }
    if (cfg.server.idle_timeout_s < 0) {
        throw std::runtime_error("Invalid config " + path + ": idle_timeout_s must not be negative");
    }

    return cfg;
}

void apply_env_overrides(AppConfig& cfg) {
    if (const char* port = env_or_null("HTTP_PORT")) {
        cfg.server.port = parse_port(port);
    }
    if (const char* root = env_or_null("SERVER_ROOT")) {
        cfg.server.root = root;
    }
    if (const char* level = env_or_null("LOG_LEVEL")) {
        cfg.logging.level = level;
    }
}

std::string canonical_root(const std::string& root) {
    std::error_code ec;
    fs::path canonical = fs::canonical(root, ec);
    if (ec) {
        throw std::runtime_error("Cannot resolve root '" + root + "': " + ec.message());
    }
    if (!fs::is_directory(canonical, ec)) {
        throw std::runtime_error("Root is not a directory: " + canonical.string());
    }
    return canonical.string();
}

} // namespace statik
