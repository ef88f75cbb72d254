#include "coldstash/file_enumerator.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "util/parallel.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace coldstash {

Result FileEnumerator::ResolveRoot(const std::string& path, std::string& root, bool& is_file) {
    std::error_code ec;
    const fs::path abs = fs::absolute(fs::path(path), ec).lexically_normal();
    if (ec) {
        return Result::Fail(ErrorCode::InvalidInputPath, "cannot resolve path: " + path);
    }

    const auto st = fs::status(abs, ec);
    if (ec || (!fs::is_regular_file(st) && !fs::is_directory(st))) {
        return Result::Fail(ErrorCode::InvalidInputPath,
                            "'" + path + "' is not a valid file or directory path");
    }

    is_file = fs::is_regular_file(st);
    if (is_file) {
        root = abs.parent_path().string();
    } else {
        // a trailing separator leaves an empty filename
        root = abs.has_filename() ? abs.string() : abs.parent_path().string();
    }
    return Result::Ok();
}

Result FileEnumerator::Enumerate(const std::string& path, FileSet& out) const {
    out = FileSet{};

    bool is_file = false;
    auto r = ResolveRoot(path, out.root, is_file);
    if (!r.is_ok()) return r;

    if (is_file) {
        std::error_code ec;
        const fs::path abs = fs::absolute(fs::path(path), ec).lexically_normal();
        FileEntry entry;
        entry.path = abs.filename().string();
        entry.size = static_cast<std::uint64_t>(fs::file_size(abs, ec));
        if (ec) return Result::Fail(ec.value(), "stat " + abs.string() + ": " + ec.message());
        out.files.push_back(std::move(entry));
    } else {
        r = Walk(out.root, out.files);
        if (!r.is_ok()) return r;
        if (out.files.empty()) {
            return Result::Fail(ErrorCode::EmptyFileSet, "No files found in " + out.root);
        }
    }

    return Fingerprint(out.root, out.files);
}

Result FileEnumerator::Walk(const std::string& root, FileList& out) const {
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) return Result::Fail(ec.value(), "cannot list " + root + ": " + ec.message());

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return Result::Fail(ec.value(), "walk " + root + ": " + ec.message());

        const fs::directory_entry& de = *it;
        const std::string name = de.path().filename().string();

        if (IsHiddenName(name)) {
            if (de.is_directory(ec) && !de.is_symlink(ec)) it.disable_recursion_pending();
            continue;
        }
        if (de.is_symlink(ec)) {
            LogWarn("skip symlink: %s", de.path().c_str());
            continue;
        }
        if (de.is_directory(ec)) continue;
        if (!de.is_regular_file(ec)) {
            LogWarn("skip special file: %s", de.path().c_str());
            continue;
        }
        if (opt_.naming.IsArtifactName(name)) {
            LogDebug("skip archive artifact: %s", de.path().c_str());
            continue;
        }

        FileEntry entry;
        entry.path = de.path().lexically_relative(root).generic_string();
        entry.size = static_cast<std::uint64_t>(de.file_size(ec));
        if (ec) return Result::Fail(ec.value(), "stat " + de.path().string() + ": " + ec.message());
        out.push_back(std::move(entry));
    }
    if (ec) return Result::Fail(ec.value(), "walk " + root + ": " + ec.message());

    std::sort(out.begin(), out.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.path < b.path; });
    return Result::Ok();
}

Result FileEnumerator::Fingerprint(const std::string& root, FileList& files) const {
    const std::uint64_t total = TotalSize(files);
    std::atomic<std::uint64_t> hashed{0};
    std::mutex progress_mu;

    auto hash_one = [&](size_t i) -> Result {
        FileEntry& entry = files[i];
        const std::string full = (fs::path(root) / entry.path).string();
        auto r = Sha256HexFile(full, entry.fingerprint);
        if (!r.is_ok()) return r;

        const std::uint64_t done = hashed.fetch_add(entry.size) + entry.size;
        if (opt_.progress_sink) {
            std::lock_guard<std::mutex> lk(progress_mu);
            opt_.progress_sink->OnProgress({.stage = "hash", .subject = root, .done = done, .total = total});
        }
        return Result::Ok();
    };

    auto r = ParallelFor(files.size(), opt_.hash_workers, hash_one);
    if (!r.is_ok()) return r;

    LogInfo("Fingerprinted %zu files (%llu bytes) under %s",
            files.size(), (unsigned long long)total, root.c_str());
    return Result::Ok();
}

} // namespace coldstash
