#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace statik {

struct DirectoryEntry {
    std::string name;
    bool is_directory = false;
};

// Directories first, then files; byte-wise by name within each group
bool entry_order(const DirectoryEntry& a, const DirectoryEntry& b);

// Immediate children of dir_path, sorted by entry_order().
// Throws std::filesystem::filesystem_error if the directory cannot be read.
std::vector<DirectoryEntry> list_directory(const std::string& dir_path);

// HTML index page. display_path is the request path the listing is for.
std::string render_listing(const std::string& display_path,
                           const std::vector<DirectoryEntry>& entries);

std::string html_escape(std::string_view text);

} // namespace statik
