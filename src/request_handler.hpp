#pragma once

#include "config.hpp"
#include "path_resolver.hpp"
#include "request.hpp"
#include "response.hpp"
#include <optional>
#include <string>

namespace statik {

constexpr const char* kIndexDocument = "index.html";

// Maps one request onto the files beneath the configured root.
// Stateless apart from the root; safe to share between workers.
class RequestHandler {
public:
    // root must already be canonical (see canonical_root())
    explicit RequestHandler(std::string root);

    Response handle(const Request& request) const;

    const std::string& root() const { return root_; }

private:
    Response serve_target(const ResolvedTarget& target) const;
    Response serve_directory(const ResolvedTarget& target) const;
    std::optional<Response> open_index(const std::string& dir_path) const;
    Response serve_file(const std::string& path, const std::string& content_type) const;

    std::string root_;
};

} // namespace statik
