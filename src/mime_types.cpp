#include "mime_types.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace statik {

const std::unordered_map<std::string, std::string>& mime_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {".html", "text/html"},
        {".htm",  "text/html"},
        {".css",  "text/css"},
        {".js",   "application/javascript"},
        {".json", "application/json"},
        {".txt",  "text/plain"},
        {".xml",  "application/xml"},
        {".png",  "image/png"},
        {".jpg",  "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif",  "image/gif"},
        {".svg",  "image/svg+xml"},
        {".ico",  "image/x-icon"},
        {".pdf",  "application/pdf"},
        {".wasm", "application/wasm"},
        {".woff", "font/woff"},
        {".woff2","font/woff2"},
        {".ttf",  "font/ttf"},
    };
    return table;
}

std::string file_extension(const std::string& path) {
    return fs::path(path).filename().extension().string();
}

const std::string& mime_type_for(const std::string& path) {
    static const std::string fallback = kDefaultMimeType;

    const auto& table = mime_table();
    auto it = table.find(file_extension(path));
    if (it != table.end()) {
        return it->second;
    }
    return fallback;
}

} // namespace statik
