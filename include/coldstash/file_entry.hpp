#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace coldstash {

struct FileEntry {
    std::string path;        // relative to the archive root, '/' separated
    std::uint64_t size = 0;
    std::string fingerprint; // sha256 hex

    bool operator==(const FileEntry&) const = default;
};

using FileList = std::vector<FileEntry>;

std::uint64_t TotalSize(const FileList& files);

} // namespace coldstash
