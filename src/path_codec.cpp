#include "path_codec.hpp"
#include <cctype>
#include <cstring>

namespace statik {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool keep_unencoded(unsigned char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return c != '\0' && std::strchr("-._~!$&'()*+,;=@/", c) != nullptr;
}

std::string percent_decode(std::string_view path) {
    std::string out;
    out.reserve(path.size());

    size_t i = 0;
    while (i < path.size()) {
        if (path[i] == '%' && i + 2 < path.size()) {
            int hi = hex_value(path[i + 1]);
            int lo = hex_value(path[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 3;
                continue;
            }
        }
        out.push_back(path[i]);
        i += 1;
    }
    return out;
}

std::string percent_encode(std::string_view name) {
    static const char digits[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(name.size());
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (keep_unencoded(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    return out;
}

static bool is_scheme(std::string_view s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::optional<std::string_view> request_path(std::string_view target) {
    std::string_view path = target.substr(0, target.find_first_of("?#"));

    // Absolute-form: "http://host:port/path"
    auto scheme_end = path.find("://");
    if (scheme_end != std::string_view::npos && is_scheme(path.substr(0, scheme_end))) {
        auto path_start = path.find('/', scheme_end + 3);
        if (path_start == std::string_view::npos) {
            return std::string_view("/");
        }
        return path.substr(path_start);
    }

    // Origin-form only; "*" and authority-form have no file behind them
    if (path.empty() || path[0] != '/') {
        return std::nullopt;
    }
    return path;
}

} // namespace statik
