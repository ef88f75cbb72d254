#pragma once

#include "io/archive_adapter.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace coldstash {

struct BundleMemberInfo {
    std::string path; // normalized relative path
    std::uint64_t size = 0;
};

// Sequential reader over the regular-file members of a (compressed) tar.
class BundleReader {
public:
    BundleReader() = default;

    BundleReader(const BundleReader&) = delete;
    BundleReader& operator=(const BundleReader&) = delete;

    Result Open(IReader& src);

    // Moves to the next regular file member; eof=true at end of archive.
    Result Next(BundleMemberInfo& out, bool& eof);

    // Streams the current member. Must be read to EOF (or SkipCurrent) before Next().
    Result OpenCurrentMemberReader(std::unique_ptr<IReader>& out_reader);

    Result SkipCurrent();

private:
    std::unique_ptr<archive, ArchiveReadDeleter> ar_;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;

    class MemberReader final : public IReader {
    public:
        explicit MemberReader(BundleReader* parent) : parent_(parent) {}
        ssize_t Read(std::span<std::uint8_t> out) override;
        std::optional<std::uint64_t> TotalSize() const override;

    private:
        BundleReader* parent_ = nullptr;
    };
};

} // namespace coldstash
