#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace coldstash {

// Read-only private mapping of a whole file. Empty files are represented
// by an empty span without a mapping.
class MappedFile {
  public:
    static Result Open(const std::string& path, MappedFile& out);

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;
    ~MappedFile();

    std::span<const std::uint8_t> Bytes() const;
    std::uint64_t Size() const { return size_; }

  private:
    void Unmap();

    void* addr_ = nullptr;
    std::uint64_t size_ = 0;
};

} // namespace coldstash
