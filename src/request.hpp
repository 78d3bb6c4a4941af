#pragma once

#include <string>
#include <utility>
#include <vector>

namespace statik {

struct Request {
    std::string method;
    std::string target;     // raw, still percent-encoded
    std::string version;    // "HTTP/1.0" or "HTTP/1.1"
    std::vector<std::pair<std::string, std::string>> headers;
    bool keep_alive = true;

    // Case-insensitive header lookup, nullptr if absent
    const std::string* header(const std::string& name) const;
};

} // namespace statik
