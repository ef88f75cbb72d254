#include "coldstash/file_entry.hpp"

namespace coldstash {

std::uint64_t TotalSize(const FileList& files) {
    std::uint64_t total = 0;
    for (const auto& f : files) total += f.size;
    return total;
}

} // namespace coldstash
