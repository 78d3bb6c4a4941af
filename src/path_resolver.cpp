#include "path_resolver.hpp"
#include <vector>

namespace statik {

std::string normalize_path(const std::string& absolute_path) {
    std::vector<std::string> segments;

    size_t pos = 0;
    while (pos <= absolute_path.size()) {
        size_t next = absolute_path.find('/', pos);
        if (next == std::string::npos) {
            next = absolute_path.size();
        }
        std::string segment = absolute_path.substr(pos, next - pos);
        pos = next + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            // ".." at the filesystem root stays at the root
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(std::move(segment));
    }

    if (segments.empty()) {
        return "/";
    }

    std::string out;
    for (const auto& segment : segments) {
        out += '/';
        out += segment;
    }
    return out;
}

bool is_within_root(const std::string& root, const std::string& path) {
    if (path.compare(0, root.size(), root) != 0) {
        return false;
    }
    if (path.size() == root.size()) {
        return true;
    }
    // "/srv/www" must not admit "/srv/wwwroot"
    return root.back() == '/' || path[root.size()] == '/';
}

ResolvedTarget resolve_target(const std::string& root, const std::string& decoded_path) {
    if (decoded_path.find('\0') != std::string::npos) {
        throw PathTraversalError(decoded_path.substr(0, decoded_path.find('\0')) + "\\0");
    }

    std::string canonical_root = normalize_path(root);
    std::string resolved = normalize_path(canonical_root + "/" + decoded_path);

    if (!is_within_root(canonical_root, resolved)) {
        throw PathTraversalError(decoded_path);
    }
    return ResolvedTarget(std::move(resolved), canonical_root.size());
}

} // namespace statik
