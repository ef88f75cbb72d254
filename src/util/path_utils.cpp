#include "util/path_utils.hpp"

#include <cstdlib>

namespace coldstash {

std::string ExpandUser(const std::string& path) {
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home && *home) return std::string(home) + path.substr(1);
    }
    return path;
}

} // namespace coldstash
