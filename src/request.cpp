#include "request.hpp"
#include <strings.h>

namespace statik {

const std::string* Request::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() && strncasecmp(key.c_str(), name.c_str(), key.size()) == 0) {
            return &value;
        }
    }
    return nullptr;
}

} // namespace statik
