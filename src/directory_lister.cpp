#include "directory_lister.hpp"
#include "path_codec.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace statik {

bool entry_order(const DirectoryEntry& a, const DirectoryEntry& b) {
    if (a.is_directory != b.is_directory) {
        return a.is_directory;
    }
    // char_traits<char>::lt compares as unsigned char
    return a.name < b.name;
}

std::vector<DirectoryEntry> list_directory(const std::string& dir_path) {
    std::vector<DirectoryEntry> entries;

    for (const auto& entry : fs::directory_iterator(dir_path)) {
        // Follows symlinks; a dangling link is listed as a file
        std::error_code ec;
        bool is_dir = entry.is_directory(ec);
        entries.push_back({entry.path().filename().string(), is_dir && !ec});
    }

    std::sort(entries.begin(), entries.end(), entry_order);
    return entries;
}

std::string html_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:   out += c;        break;
        }
    }
    return out;
}

std::string render_listing(const std::string& display_path,
                           const std::vector<DirectoryEntry>& entries) {
    std::string base = display_path;
    if (base.empty() || base.back() != '/') {
        base += '/';
    }
    const std::string title = html_escape(base);

    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html>\n"
         << "<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<base href=\"" << html_escape(percent_encode(base)) << "\">\n"
         << "<title>Index of " << title << "</title>\n"
         << "</head>\n"
         << "<body>\n"
         << "<h1>Index of " << title << "</h1>\n"
         << "<ul>\n";

    for (const auto& entry : entries) {
        const char* suffix = entry.is_directory ? "/" : "";
        html << "<li><a href=\"" << html_escape(percent_encode(entry.name)) << suffix << "\">"
             << html_escape(entry.name) << suffix << "</a></li>\n";
    }

    html << "</ul>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

} // namespace statik
