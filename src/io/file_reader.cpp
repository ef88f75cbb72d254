#include "io/file_reader.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace coldstash {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    auto r = Fd::OpenRead(out.path_, out.fd_);
    if (!r.is_ok()) return r;

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) == 0 && S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result FileWriter::Create(std::string path, FileWriter& out) {
    out.path_ = std::move(path);
    return Fd::OpenWrite(out.path_, out.fd_);
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno, "write " + path_ + ": " + std::strerror(errno));
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync " + path_ + ": " + std::strerror(errno));
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (!fd_.Valid()) return Result::Ok();
    const int fd = fd_.Release();
    if (::close(fd) != 0) {
        return Result::Fail(errno, "close " + path_ + ": " + std::strerror(errno));
    }
    return Result::Ok();
}

Result WriteFileAtomically(const std::string& path, std::span<const std::uint8_t> contents) {
    const std::string tmp_path = path + ".tmp";

    FileWriter writer;
    auto r = FileWriter::Create(tmp_path, writer);
    if (!r.is_ok()) return r;

    r = writer.WriteAll(contents);
    if (r.is_ok()) r = writer.FsyncNow();
    if (r.is_ok()) r = writer.Close();
    if (!r.is_ok()) {
        ::unlink(tmp_path.c_str());
        return r;
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "rename " + tmp_path + " -> " + path + ": " + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace coldstash
