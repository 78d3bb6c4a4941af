#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace statik {

struct Response {
    int status = 200;
    std::string content_type = "text/plain";
    std::vector<std::pair<std::string, std::string>> headers;

    // Either an in-memory body or an opened file streamed in chunks
    std::string body;
    std::unique_ptr<std::ifstream> file;
    std::uintmax_t file_size = 0;

    std::uintmax_t content_length() const { return file ? file_size : body.size(); }

    static Response text(int status, const std::string& message);
    static Response html(std::string body);
    static Response error(int status);
    static Response from_file(std::unique_ptr<std::ifstream> file, std::uintmax_t size,
                              const std::string& content_type);
};

constexpr std::size_t kFileChunkSize = 64 * 1024;

const char* status_text(int status);

// Status line and headers, terminated by the empty line
std::string format_head(const Response& response, bool keep_alive);

// Write the full response to a socket. Returns false if the peer is gone
// or a streamed file ended before its advertised length.
bool write_response(int fd, Response& response, bool keep_alive);

// send() until everything is written; retries EINTR and short writes
bool send_all(int fd, const char* data, std::size_t len);

} // namespace statik
