#include "coldstash/bundle_extractor.hpp"

#include "coldstash/archive_path_policy.hpp"
#include "io/archive_adapter.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace coldstash {

Result BundleExtractor::ExtractToDir(IReader& bundle_stream, const std::string& dst_dir) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);

    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(ErrorCode::InvalidInputPath, "Destination is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_gzip(ar.get());
    archive_read_support_filter_none(ar.get());
    archive_read_support_format_tar(ar.get());

    if (OpenArchiveFromReader(ar.get(), bundle_stream) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_read_open2: " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(-1, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_PERM;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Paths are rewritten to absolute targets under dst_dir, so
    // NOABSOLUTEPATHS would reject every member.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    const std::string subject = base_dir.filename().string();
    std::uint64_t extracted = 0;
    size_t members = 0;

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) return Result::Fail(-1, "archive_read_next_header: " + ArchiveErr(ar.get()));

        std::string rel;
        auto path_res = path_policy.NormalizeMemberPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty() || rel == ".") {
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return Result::Fail(-1, "archive_read_data_skip: " + ArchiveErr(ar.get()));
            }
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty() && rel_hl != ".") {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("extract: %s", target_path.c_str());

        if (archive_write_header(aw.get(), entry) != ARCHIVE_OK) {
            return Result::Fail(-1, "archive_write_header: " + ArchiveErr(aw.get()));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) return Result::Fail(-1, "archive_read_data_block: " + ArchiveErr(ar.get()));

            if (archive_write_data_block(aw.get(), buff, size, offset) != ARCHIVE_OK) {
                return Result::Fail(-1, "archive_write_data_block: " + ArchiveErr(aw.get()));
            }

            extracted += static_cast<std::uint64_t>(size);
            if (opt_.progress_sink) {
                opt_.progress_sink->OnProgress(
                    {.stage = "extract", .subject = subject, .done = extracted, .total = opt_.total_bytes});
            }
        }

        if (archive_write_finish_entry(aw.get()) != ARCHIVE_OK) {
            return Result::Fail(-1, "archive_write_finish_entry: " + ArchiveErr(aw.get()));
        }
        ++members;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    LogInfo("Extracted %zu members (%llu bytes) into %s",
            members, (unsigned long long)extracted, dst_dir.c_str());
    return Result::Ok();
}

} // namespace coldstash
