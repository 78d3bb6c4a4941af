#include "request_handler.hpp"
#include "directory_lister.hpp"
#include "mime_types.hpp"
#include "path_codec.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace statik {

static bool is_absent(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

RequestHandler::RequestHandler(std::string root)
    : root_(std::move(root))
{
}

Response RequestHandler::handle(const Request& request) const {
    if (request.method != "GET") {
        Response r = Response::error(405);
        r.headers.emplace_back("Allow", "GET");
        return r;
    }

    auto path = request_path(request.target);
    if (!path) {
        spdlog::debug("HTTP: Unsupported request target: {}", request.target);
        return Response::error(400);
    }
    const std::string decoded = percent_decode(*path);

    try {
        return serve_target(resolve_target(root_, decoded));
    } catch (const PathTraversalError&) {
        // Same answer as a missing file so the root boundary is not revealed
        spdlog::warn("HTTP: Path traversal attempt: {}", request.target);
        return Response::error(404);
    } catch (const std::exception& e) {
        spdlog::error("HTTP: Failed to handle {}: {}", request.target, e.what());
        return Response::error(500);
    }
}

Response RequestHandler::serve_target(const ResolvedTarget& target) const {
    std::error_code ec;
    fs::file_status st = fs::status(target.path(), ec);

    if (st.type() == fs::file_type::not_found) {
        // An index or a directory may still have appeared since the stat
        return serve_directory(target);
    }
    if (ec) {
        spdlog::error("HTTP: Cannot stat {}: {}", target.path(), ec.message());
        return Response::error(500);
    }

    switch (st.type()) {
        case fs::file_type::directory:
            return serve_directory(target);
        case fs::file_type::regular:
            return serve_file(target.path(), mime_type_for(target.path()));
        default:
            // FIFOs and devices would block or never end
            spdlog::debug("HTTP: Refusing special file {}", target.path());
            return Response::error(404);
    }
}

Response RequestHandler::serve_directory(const ResolvedTarget& target) const {
    if (auto index = open_index(target.path())) {
        return std::move(*index);
    }

    try {
        auto entries = list_directory(target.path());
        return Response::html(render_listing(target.relative_path(), entries));
    } catch (const fs::filesystem_error& e) {
        if (is_absent(e.code())) {
            return Response::error(404);
        }
        spdlog::error("HTTP: Cannot list {}: {}", target.path(), e.code().message());
        return Response::error(500);
    }
}

std::optional<Response> RequestHandler::open_index(const std::string& dir_path) const {
    const std::string index_path = (fs::path(dir_path) / kIndexDocument).string();

    std::error_code ec;
    if (!fs::is_regular_file(index_path, ec)) {
        return std::nullopt;
    }

    Response r = serve_file(index_path, "text/html");
    if (r.status != 200) {
        return std::nullopt;
    }
    return {std::move(r)};
}

Response RequestHandler::serve_file(const std::string& path, const std::string& content_type) const {
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!file->is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Response::error(404);
        }
        spdlog::error("HTTP: Cannot open {}", path);
        return Response::error(500);
    }

    file->seekg(0, std::ios::end);
    std::streamoff size = file->tellg();
    file->seekg(0, std::ios::beg);
    if (size < 0 || !*file) {
        spdlog::error("HTTP: Cannot determine size of {}", path);
        return Response::error(500);
    }

    return Response::from_file(std::move(file), static_cast<std::uintmax_t>(size), content_type);
}

} // namespace statik
