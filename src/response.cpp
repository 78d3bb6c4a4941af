#include "response.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace statik {

Response Response::text(int status, const std::string& message) {
    Response r;
    r.status = status;
    r.content_type = "text/plain";
    r.body = message;
    return r;
}

Response Response::html(std::string body) {
    Response r;
    r.content_type = "text/html";
    r.body = std::move(body);
    return r;
}

Response Response::error(int status) {
    return text(status, std::to_string(status) + " " + status_text(status));
}

Response Response::from_file(std::unique_ptr<std::ifstream> file, std::uintmax_t size,
                             const std::string& content_type) {
    Response r;
    r.content_type = content_type;
    r.file = std::move(file);
    r.file_size = size;
    return r;
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string format_head(const Response& response, bool keep_alive) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.content_length() << "\r\n"
        << "Connection: " << (keep_alive ? "keep-alive" : "close") << "\r\n";
    for (const auto& [name, value] : response.headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

bool send_all(int fd, const char* data, std::size_t len) {
    while (len > 0) {
        ssize_t n = send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::debug("HTTP: send failed on fd {}: {}", fd, std::strerror(errno));
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

bool write_response(int fd, Response& response, bool keep_alive) {
    std::string head = format_head(response, keep_alive);

    if (!response.file) {
        // Small bodies go out with the head in one write
        head += response.body;
        return send_all(fd, head.data(), head.size());
    }

    if (!send_all(fd, head.data(), head.size())) {
        return false;
    }

    std::vector<char> chunk(kFileChunkSize);
    std::uintmax_t remaining = response.file_size;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<std::uintmax_t>(remaining, chunk.size()));
        response.file->read(chunk.data(), want);
        std::streamsize got = response.file->gcount();
        if (got <= 0) {
            spdlog::warn("HTTP: file shrank while sending, {} bytes short", remaining);
            return false;
        }
        if (!send_all(fd, chunk.data(), static_cast<std::size_t>(got))) {
            return false;
        }
        remaining -= static_cast<std::uintmax_t>(got);
    }
    return true;
}

} // namespace statik
