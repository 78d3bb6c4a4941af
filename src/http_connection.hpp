#pragma once

#include "request.hpp"
#include "request_handler.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace statik {

constexpr std::size_t kMaxHeadSize = 8192;
constexpr std::size_t kMaxDiscardedBody = 1024 * 1024;

// Parse a request head (request line and header lines, without the
// terminating blank line). Returns false if it is not valid HTTP/1.x.
bool parse_request_head(std::string_view head, Request& out);

// Reads HTTP/1.x request heads off one connected socket
class HttpConnection {
public:
    enum class ReadResult {
        Ok,
        Closed,     // peer closed between requests
        TimedOut,
        Malformed,
        TooLarge,
        Error,
    };

    explicit HttpConnection(int fd) : fd_(fd) {}

    // Next request on the connection; any announced body is read and dropped
    ReadResult read_request(Request& out);

    int fd() const { return fd_; }

private:
    ReadResult receive_more();
    ReadResult discard_body(std::size_t length);

    int fd_;
    std::string buffer_;
};

const char* to_string(HttpConnection::ReadResult result);

// Per-connection loop: read, handle, respond until the peer closes,
// asks to close, or the transport fails. Returns the number of requests served.
std::size_t serve_connection(int fd, const RequestHandler& handler);

} // namespace statik
