#include "coldstash/bundle_reader.hpp"

#include "util/path_utils.hpp"

namespace coldstash {

Result BundleReader::Open(IReader& src) {
    if (ar_) return Result::Fail(-1, "Bundle already opened");

    ar_.reset(archive_read_new());
    if (!ar_) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_gzip(ar_.get());
    archive_read_support_filter_none(ar_.get());
    archive_read_support_format_tar(ar_.get());

    if (OpenArchiveFromReader(ar_.get(), src) != ARCHIVE_OK) {
        const std::string em = ArchiveErr(ar_.get());
        ar_.reset();
        return Result::Fail(-1, "archive_read_open2 failed: " + em);
    }
    return Result::Ok();
}

Result BundleReader::Next(BundleMemberInfo& out, bool& eof) {
    eof = false;
    if (!ar_) return Result::Fail(-1, "Bundle not opened");

    if (in_entry_) {
        return Result::Fail(-1, "Previous member not finished (read to EOF or call SkipCurrent)");
    }

    while (true) {
        const int r = archive_read_next_header(ar_.get(), &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK) {
            return Result::Fail(-1, "archive_read_next_header: " + ArchiveErr(ar_.get()));
        }

        if (archive_entry_filetype(cur_entry_) != AE_IFREG) {
            if (archive_read_data_skip(ar_.get()) != ARCHIVE_OK) {
                return Result::Fail(-1, "archive_read_data_skip: " + ArchiveErr(ar_.get()));
            }
            continue;
        }

        const char* name = archive_entry_pathname(cur_entry_);
        out.path = NormalizeArchivePath(name ? std::string(name) : std::string());
        out.size = static_cast<std::uint64_t>(archive_entry_size(cur_entry_));

        in_entry_ = true;
        return Result::Ok();
    }
}

Result BundleReader::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    if (archive_read_data_skip(ar_.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_read_data_skip: " + ArchiveErr(ar_.get()));
    }
    in_entry_ = false;
    return Result::Ok();
}

Result BundleReader::OpenCurrentMemberReader(std::unique_ptr<IReader>& out_reader) {
    if (!in_entry_) return Result::Fail(-1, "No current member");
    out_reader = std::make_unique<MemberReader>(this);
    return Result::Ok();
}

ssize_t BundleReader::MemberReader::Read(std::span<std::uint8_t> out) {
    if (!parent_ || !parent_->in_entry_) return -1;
    const la_ssize_t n = archive_read_data(parent_->ar_.get(), out.data(), out.size());
    if (n < 0) return -1;
    if (n == 0) {
        parent_->in_entry_ = false;
        return 0;
    }
    return static_cast<ssize_t>(n);
}

std::optional<std::uint64_t> BundleReader::MemberReader::TotalSize() const {
    if (!parent_ || !parent_->cur_entry_) return std::nullopt;
    const la_int64_t sz = archive_entry_size(parent_->cur_entry_);
    if (sz < 0) return std::nullopt;
    return static_cast<std::uint64_t>(sz);
}

} // namespace coldstash
