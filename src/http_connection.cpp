#include "http_connection.hpp"
#include "response.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <strings.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

namespace statik {

static std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

static bool is_token(std::string_view s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isgraph(c) && !std::strchr("()<>@,;:\\\"/[]?={}", c);
    });
}

static bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && strncasecmp(a.data(), b.data(), a.size()) == 0;
}

// Applies a Connection header's tokens to the version default
static bool keep_alive_for(const std::string& version, const std::string* connection) {
    bool keep_alive = version == "HTTP/1.1";
    if (!connection) {
        return keep_alive;
    }

    std::string_view rest = *connection;
    while (!rest.empty()) {
        auto comma = rest.find(',');
        std::string_view option = trim(rest.substr(0, comma));
        if (iequals(option, "close")) return false;
        if (iequals(option, "keep-alive")) keep_alive = true;
        if (comma == std::string_view::npos) break;
        rest.remove_prefix(comma + 1);
    }
    return keep_alive;
}

bool parse_request_head(std::string_view head, Request& out) {
    auto line_end = head.find("\r\n");
    std::string_view request_line = head.substr(0, line_end);

    // "GET /path HTTP/1.1"
    auto sp1 = request_line.find(' ');
    if (sp1 == std::string_view::npos) return false;
    auto sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos || request_line.find(' ', sp2 + 1) != std::string_view::npos) {
        return false;
    }

    std::string_view method = request_line.substr(0, sp1);
    std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string_view version = request_line.substr(sp2 + 1);
    if (!is_token(method) || target.empty() || (version != "HTTP/1.1" && version != "HTTP/1.0")) {
        return false;
    }

    out.method = std::string(method);
    out.target = std::string(target);
    out.version = std::string(version);
    out.headers.clear();

    while (line_end != std::string_view::npos) {
        head.remove_prefix(line_end + 2);
        line_end = head.find("\r\n");
        std::string_view line = head.substr(0, line_end);

        auto colon = line.find(':');
        if (colon == std::string_view::npos || !is_token(line.substr(0, colon))) {
            return false;
        }
        out.headers.emplace_back(std::string(line.substr(0, colon)),
                                 std::string(trim(line.substr(colon + 1))));
    }

    out.keep_alive = keep_alive_for(out.version, out.header("Connection"));
    return true;
}

HttpConnection::ReadResult HttpConnection::receive_more() {
    char buf[4096];
    for (;;) {
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            buffer_.append(buf, static_cast<std::size_t>(n));
            return ReadResult::Ok;
        }
        if (n == 0) {
            return ReadResult::Closed;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return ReadResult::TimedOut;
        }
        spdlog::debug("HTTP: recv failed on fd {}: {}", fd_, std::strerror(errno));
        return ReadResult::Error;
    }
}

HttpConnection::ReadResult HttpConnection::discard_body(std::size_t length) {
    while (buffer_.size() < length) {
        length -= buffer_.size();
        buffer_.clear();
        ReadResult r = receive_more();
        if (r != ReadResult::Ok) {
            return r == ReadResult::Closed ? ReadResult::Malformed : r;
        }
    }
    buffer_.erase(0, length);
    return ReadResult::Ok;
}

HttpConnection::ReadResult HttpConnection::read_request(Request& out) {
    for (;;) {
        // Stray CRLFs between requests are allowed
        auto start = buffer_.find_first_not_of("\r\n");
        buffer_.erase(0, start == std::string::npos ? buffer_.size() : start);

        auto end = buffer_.find("\r\n\r\n");
        if (end != std::string::npos) {
            if (end > kMaxHeadSize) {
                return ReadResult::TooLarge;
            }
            std::string head = buffer_.substr(0, end);
            buffer_.erase(0, end + 4);

            if (!parse_request_head(head, out)) {
                return ReadResult::Malformed;
            }
            if (out.header("Transfer-Encoding")) {
                return ReadResult::Malformed;
            }
            if (const std::string* length = out.header("Content-Length")) {
                if (length->empty() || length->size() > 10 ||
                    !std::all_of(length->begin(), length->end(),
                                 [](unsigned char c) { return std::isdigit(c) != 0; })) {
                    return ReadResult::Malformed;
                }
                std::size_t body_length = std::stoull(*length);
                if (body_length > kMaxDiscardedBody) {
                    return ReadResult::TooLarge;
                }
                ReadResult r = discard_body(body_length);
                if (r != ReadResult::Ok) {
                    return r;
                }
            }
            return ReadResult::Ok;
        }

        if (buffer_.size() > kMaxHeadSize) {
            return ReadResult::TooLarge;
        }

        ReadResult r = receive_more();
        if (r == ReadResult::Closed && !buffer_.empty()) {
            return ReadResult::Malformed;
        }
        if (r != ReadResult::Ok) {
            return r;
        }
    }
}

const char* to_string(HttpConnection::ReadResult result) {
    switch (result) {
        case HttpConnection::ReadResult::Ok:        return "ok";
        case HttpConnection::ReadResult::Closed:    return "closed by peer";
        case HttpConnection::ReadResult::TimedOut:  return "idle timeout";
        case HttpConnection::ReadResult::Malformed: return "malformed request";
        case HttpConnection::ReadResult::TooLarge:  return "request too large";
        case HttpConnection::ReadResult::Error:     return "transport error";
    }
    return "unknown";
}

std::size_t serve_connection(int fd, const RequestHandler& handler) {
    HttpConnection conn(fd);
    std::size_t served = 0;

    for (;;) {
        Request request;
        HttpConnection::ReadResult result = conn.read_request(request);
        if (result != HttpConnection::ReadResult::Ok) {
            if (result == HttpConnection::ReadResult::Malformed ||
                result == HttpConnection::ReadResult::TooLarge) {
                spdlog::warn("HTTP: Dropping connection fd {}: {}", fd, to_string(result));
            } else {
                spdlog::debug("HTTP: Connection fd {} ended: {}", fd, to_string(result));
            }
            break;
        }

        spdlog::info("{} {}", request.method, request.target);
        Response response = handler.handle(request);
        spdlog::debug("HTTP: {} {} -> {}", request.method, request.target, response.status);
        ++served;

        if (!write_response(fd, response, request.keep_alive)) {
            spdlog::debug("HTTP: Write failed on fd {}, closing", fd);
            break;
        }
        if (!request.keep_alive) {
            break;
        }
    }

    return served;
}

} // namespace statik
