#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace statik {

class PathTraversalError : public std::runtime_error {
public:
    explicit PathTraversalError(const std::string& request_path)
        : std::runtime_error("path escapes root: " + request_path) {}
};

class ResolvedTarget;

// Join a decoded request path onto the canonical root and normalize it
// lexically. Throws PathTraversalError if the result is outside root.
ResolvedTarget resolve_target(const std::string& root, const std::string& decoded_path);

// Absolute path that is root itself or lies beneath it. Only
// resolve_target() can make one.
class ResolvedTarget {
public:
    const std::string& path() const { return path_; }

    // Request-style path relative to root, always starting with '/'
    std::string relative_path() const {
        if (is_root()) return "/";
        return root_len_ == 1 ? path_ : path_.substr(root_len_);
    }

    bool is_root() const { return path_.size() == root_len_; }

private:
    friend ResolvedTarget resolve_target(const std::string&, const std::string&);
    ResolvedTarget(std::string path, size_t root_len) : path_(std::move(path)), root_len_(root_len) {}

    std::string path_;
    size_t root_len_;
};

// Lexical normalization of an absolute path: collapses '.', '..' and
// repeated separators without touching the filesystem.
std::string normalize_path(const std::string& absolute_path);

// True if path equals root or continues it past a '/' boundary
bool is_within_root(const std::string& root, const std::string& path);

} // namespace statik
