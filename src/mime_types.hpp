#pragma once

#include <string>
#include <unordered_map>

namespace statik {

constexpr const char* kDefaultMimeType = "application/octet-stream";

// Extension of the last path segment including the dot ("" if none).
// A leading dot alone (".profile") is not an extension.
std::string file_extension(const std::string& path);

// Content type for a file path. Lookup is case-sensitive; unknown
// extensions map to kDefaultMimeType.
const std::string& mime_type_for(const std::string& path);

// Immutable extension -> content type table shared by all workers
const std::unordered_map<std::string, std::string>& mime_table();

} // namespace statik
