#include "io/mapped_file.hpp"

#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <sys/mman.h>
#include <sys/stat.h>
#include <utility>

namespace coldstash {

Result MappedFile::Open(const std::string& path, MappedFile& out) {
    out.Unmap();

    Fd fd;
    auto r = Fd::OpenRead(path, fd);
    if (!r.is_ok()) return r;

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) {
        return Result::Fail(errno, "stat " + path + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(EINVAL, "not a regular file: " + path);
    }
    if (st.st_size == 0) return Result::Ok();

    void* addr = ::mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd.Get(), 0);
    if (addr == MAP_FAILED) {
        return Result::Fail(errno, "mmap " + path + ": " + std::strerror(errno));
    }
    (void)::madvise(addr, static_cast<size_t>(st.st_size), MADV_SEQUENTIAL);

    out.addr_ = addr;
    out.size_ = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

MappedFile::MappedFile(MappedFile&& other) noexcept
    : addr_(std::exchange(other.addr_, nullptr)), size_(std::exchange(other.size_, 0)) {}

MappedFile& MappedFile::operator=(MappedFile&& other) noexcept {
    if (this != &other) {
        Unmap();
        addr_ = std::exchange(other.addr_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

MappedFile::~MappedFile() { Unmap(); }

std::span<const std::uint8_t> MappedFile::Bytes() const {
    if (!addr_) return {};
    return {static_cast<const std::uint8_t*>(addr_), static_cast<size_t>(size_)};
}

void MappedFile::Unmap() {
    if (addr_) {
        ::munmap(addr_, static_cast<size_t>(size_));
    }
    addr_ = nullptr;
    size_ = 0;
}

} // namespace coldstash
