#include "coldstash/bundle_builder.hpp"

#include "io/archive_adapter.hpp"
#include "io/counting_reader.hpp"
#include "io/file_reader.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace coldstash {

namespace {

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

} // namespace

Result CheckSizeCeiling(const FileList& files, std::uint64_t limit) {
    const std::uint64_t total = TotalSize(files);
    if (total > limit) {
        return Result::Fail(ErrorCode::SizeLimitExceeded,
                            "total size " + std::to_string(total) + " bytes exceeds the limit of " +
                                std::to_string(limit) + " bytes");
    }
    return Result::Ok();
}

Result BundleBuilder::Build(const std::string& root,
                            const FileList& files,
                            const std::string& bundle_path) const {
    namespace fs = std::filesystem;

    const std::string partial = bundle_path + ".partial";
    const std::string subject = fs::path(bundle_path).filename().string();

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) return Result::Fail(-1, "archive_write_new failed");

    if (archive_write_add_filter_gzip(aw.get()) != ARCHIVE_OK ||
        archive_write_set_format_pax_restricted(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "libarchive setup: " + ArchiveErr(aw.get()));
    }
    if (archive_write_open_filename(aw.get(), partial.c_str()) != ARCHIVE_OK) {
        return Result::Fail(-1, "open " + partial + ": " + ArchiveErr(aw.get()));
    }

    auto fail = [&](Result r) {
        aw.reset();
        ::unlink(partial.c_str());
        return r;
    };

    const std::uint64_t total = TotalSize(files);
    std::uint64_t written = 0;
    std::vector<std::uint8_t> buf(opt_.chunk_bytes ? opt_.chunk_bytes : 64 * 1024);

    for (const auto& f : files) {
        const std::string full = (fs::path(root) / f.path).string();

        auto file = std::make_unique<FileReader>();
        auto r = FileReader::Open(full, *file);
        if (!r.is_ok()) return fail(r);

        struct stat st{};
        if (::stat(full.c_str(), &st) != 0) {
            const int err = errno;
            return fail(Result::Fail(err, "stat " + full + ": " + std::strerror(err)));
        }

        std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
        if (!entry) return fail(Result::Fail(-1, "archive_entry_new failed"));
        archive_entry_set_pathname(entry.get(), f.path.c_str());
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), st.st_mode & 07777);
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(f.size));
        archive_entry_set_mtime(entry.get(), st.st_mtime, 0);

        if (archive_write_header(aw.get(), entry.get()) != ARCHIVE_OK) {
            return fail(Result::Fail(-1, "archive_write_header " + f.path + ": " + ArchiveErr(aw.get())));
        }

        CountingReader in(std::move(file), &written);
        while (true) {
            if (CancelRequested()) return fail(Result::Fail(ErrorCode::Cancelled, "bundle build interrupted"));

            const ssize_t n = in.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
            if (n == 0) break;
            if (n < 0) {
                const int err = errno;
                return fail(Result::Fail(err, "read " + full + ": " + std::strerror(err)));
            }
            if (in.BytesRead() > f.size) {
                return fail(Result::Fail(-1, "file grew while bundling: " + full));
            }
            if (archive_write_data(aw.get(), buf.data(), static_cast<size_t>(n)) < 0) {
                return fail(Result::Fail(-1, "archive_write_data " + f.path + ": " + ArchiveErr(aw.get())));
            }
            if (opt_.progress_sink) {
                opt_.progress_sink->OnProgress({.stage = "bundle", .subject = subject, .done = written, .total = total});
            }
        }
        if (in.BytesRead() != f.size) {
            return fail(Result::Fail(-1, "file shrank while bundling: " + full));
        }
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return fail(Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get())));
    }
    aw.reset();

    if (std::rename(partial.c_str(), bundle_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(partial.c_str());
        return Result::Fail(err, "rename " + partial + " -> " + bundle_path + ": " + std::strerror(err));
    }

    LogInfo("Bundled %zu files (%llu bytes) into %s",
            files.size(), (unsigned long long)total, bundle_path.c_str());
    return Result::Ok();
}

} // namespace coldstash
