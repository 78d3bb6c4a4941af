#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace statik {

// Decode %XX escapes. A '%' that does not start a valid escape is kept as is.
std::string percent_decode(std::string_view path);

// Escape every byte outside the URL path character set as %XX
std::string percent_encode(std::string_view name);

// Path component of a request target: query and fragment stripped,
// scheme and authority dropped from absolute-form targets. Empty optional
// when the target is neither origin-form nor absolute-form.
std::optional<std::string_view> request_path(std::string_view target);

} // namespace statik
