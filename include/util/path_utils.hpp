#pragma once

#include <string>
#include <string_view>

namespace coldstash {

// Dot-files and dot-directories are never archived.
inline bool IsHiddenName(std::string_view name) {
    return !name.empty() && name.front() == '.';
}

// Normalize an archive member path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Expands a leading "~/" using $HOME.
std::string ExpandUser(const std::string& path);

} // namespace coldstash
