#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace coldstash {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

// Sequential writer over a regular file.
class FileWriter final : public IWriter {
public:
    static Result Create(std::string path, FileWriter &out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

private:
    std::string path_;
    Fd fd_;
};

// Writes `contents` to `path` through a temp file + rename so readers never
// observe a half-written file.
Result WriteFileAtomically(const std::string& path, std::span<const std::uint8_t> contents);

} // namespace coldstash
