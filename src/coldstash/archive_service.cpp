#include "coldstash/archive_service.hpp"

#include "crypto/sha256.hpp"
#include "util/console_progress.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <ctime>
#include <filesystem>
#include <set>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace coldstash {

void ArchiveService::DiscardBundle(const ArchiveRequest& req, const std::string& bundle_path) const {
    if (req.keep_artifacts) {
        LogInfo("Keeping %s", bundle_path.c_str());
        return;
    }
    if (::unlink(bundle_path.c_str()) != 0 && errno != ENOENT) {
        LogWarn("could not delete %s", bundle_path.c_str());
    }
}

Result ArchiveService::PrepareFromSources(const ArchiveRequest& req, ArchiveOutcome& out, FileSet& set) {
    std::string root;
    bool is_file = false;
    auto r = FileEnumerator::ResolveRoot(req.path, root, is_file);
    if (!r.is_ok()) return r;

    std::string id;
    r = store_.Create(root, CreateOptions{.force = req.force, .overwrite = req.overwrite}, id);
    if (!r.is_ok()) return r;

    FileEnumerator enumerator(FileEnumerator::Options{
        .naming = opt_.naming, .hash_workers = opt_.hash_workers, .progress_sink = opt_.progress_sink});
    r = enumerator.Enumerate(req.path, set);
    if (!r.is_ok()) return r;

    r = CheckSizeCeiling(set.files, opt_.max_source_bytes);
    if (!r.is_ok()) return r;

    out.manifest.id = id;
    out.bundle_path = (fs::path(set.root) / opt_.naming.BundleName(id)).string();

    LogInfo("Archiving %zu files in %s (%s)", set.files.size(), set.root.c_str(),
            ReadableBytes(TotalSize(set.files)).c_str());

    BundleBuilder builder(BundleBuilder::Options{.progress_sink = opt_.progress_sink});
    r = builder.Build(set.root, set.files, out.bundle_path);
    if (!r.is_ok()) return r;

    if (hooks_.on_bundle_built) hooks_.on_bundle_built(out.bundle_path);

    IntegrityVerifier verifier(IntegrityVerifier::Options{.mode = opt_.integrity_mode,
                                                          .progress_sink = opt_.progress_sink});
    r = verifier.VerifyBuild(out.bundle_path, set.files);
    if (!r.is_ok()) {
        LogError("Bundle %s failed verification", out.bundle_path.c_str());
        DiscardBundle(req, out.bundle_path);
        return r;
    }
    return Result::Ok();
}

Result ArchiveService::PrepareFromBundle(const ArchiveRequest& req, ArchiveOutcome& out, FileSet& set) {
    std::error_code ec;
    const fs::path bundle = fs::absolute(req.path, ec).lexically_normal();
    if (ec || !fs::is_regular_file(bundle, ec)) {
        return Result::Fail(ErrorCode::InvalidInputPath, "'" + req.path + "' is not a bundle file");
    }
    const std::string id = opt_.naming.ExtractId(bundle.filename().string());
    if (id.empty() || !opt_.naming.IsBundleName(bundle.filename().string())) {
        return Result::Fail(ErrorCode::InvalidInputPath,
                            "'" + req.path + "' is not named " + opt_.naming.BundleName("<id>"));
    }

    set.root = bundle.parent_path().string();
    if (fs::exists(fs::path(set.root) / opt_.naming.SidecarName(id), ec) && !req.overwrite) {
        return Result::Fail(ErrorCode::DuplicateArchiveExists,
                            "archive " + id + " already has a manifest in " + set.root);
    }

    // Member fingerprints come from the bundle itself; a bundle that cannot
    // be read end to end is rejected here.
    IntegrityVerifier verifier(IntegrityVerifier::Options{.mode = opt_.integrity_mode,
                                                          .progress_sink = opt_.progress_sink});
    auto r = verifier.ScanBundle(bundle.string(), set.files);
    if (!r.is_ok()) {
        return Result::Fail(ErrorCode::IntegrityMismatchBuildTime, "cannot read " + bundle.string() + ": " + r.msg);
    }
    if (set.files.empty()) return Result::Fail(ErrorCode::EmptyFileSet, bundle.string() + " has no members");

    r = CheckSizeCeiling(set.files, opt_.max_source_bytes);
    if (!r.is_ok()) return r;

    out.manifest.id = id;
    out.bundle_path = bundle.string();
    LogInfo("Archiving existing bundle %s (%zu members)", out.bundle_path.c_str(), set.files.size());
    return Result::Ok();
}

Result ArchiveService::Archive(const ArchiveRequest& req, ArchiveOutcome& out) {
    out = ArchiveOutcome{};

    if (req.backend.kind != LocationKind::DryRun && backend_ == nullptr) {
        return Result::Fail(ErrorCode::BackendUnavailable, "no transfer backend configured");
    }
    if (backend_ && req.backend.kind != LocationKind::DryRun && backend_->Kind() != req.backend.kind) {
        return Result::Fail(ErrorCode::InvalidConfig, "backend does not match the requested location");
    }

    FileSet set;
    auto r = req.existing_bundle ? PrepareFromBundle(req, out, set) : PrepareFromSources(req, out, set);
    if (!r.is_ok()) return r;

    Manifest& m = out.manifest;
    m.timestamp = FormatTimestamp(std::time(nullptr));
    m.location = req.backend.kind;
    m.filename = fs::path(out.bundle_path).filename().string();
    m.local_path = set.root;
    m.archive_path = req.backend.kind == LocationKind::DryRun ? std::string() : req.backend.Container();
    m.files = set.files;
    m.owner = opt_.owner;

    r = Sha256HexFile(out.bundle_path, m.bundle_fingerprint);
    if (!r.is_ok()) {
        DiscardBundle(req, out.bundle_path);
        return r;
    }

    if (req.backend.kind == LocationKind::DryRun) {
        LogInfo("Dry run complete for %s (bundle %s)", m.local_path.c_str(), m.bundle_fingerprint.c_str());
        DiscardBundle(req, out.bundle_path);
        return Result::Ok();
    }

    r = Ship(req, out);
    if (!r.is_ok()) return r;

    if (req.remove_sources && !req.existing_bundle) RemoveSources(set);
    return Result::Ok();
}

Result ArchiveService::Ship(const ArchiveRequest& req, ArchiveOutcome& out) {
    Manifest& m = out.manifest;

    IntegrityVerifier verifier(IntegrityVerifier::Options{.mode = opt_.integrity_mode, .progress_sink = nullptr});
    auto r = verifier.VerifyBundleFingerprint(out.bundle_path, m.bundle_fingerprint, VerifyPhase::TransferTime);
    if (!r.is_ok()) {
        DiscardBundle(req, out.bundle_path);
        return r;
    }

    RemoteLocator locator;
    r = backend_->Upload(out.bundle_path, req.backend, opt_.progress_sink, locator);
    if (!r.is_ok()) {
        LogError("Upload failed; bundle left at %s", out.bundle_path.c_str());
        return r;
    }
    out.uploaded = true;
    m.archive_path = locator.container;
    m.filename = locator.object;

    r = store_.Persist(m);
    if (!r.is_ok()) return r;
    out.persisted = true;

    DiscardBundle(req, out.bundle_path);
    LogInfo("Archived %s as %s to %s", m.local_path.c_str(), m.id.c_str(), locator.ToString().c_str());
    return Result::Ok();
}

void ArchiveService::RemoveSources(const FileSet& set) const {
    size_t removed = 0;
    for (const auto& f : set.files) {
        const fs::path full = fs::path(set.root) / f.path;
        std::error_code ec;
        if (fs::remove(full, ec)) {
            ++removed;
        } else if (ec) {
            LogWarn("could not remove %s: %s", full.c_str(), ec.message().c_str());
        }
    }

    // Prune only directories that held archived files, children before
    // parents (reverse lexical order), never the root itself.
    std::set<std::string> dirs;
    for (const auto& f : set.files) {
        for (fs::path d = fs::path(f.path).parent_path(); !d.empty(); d = d.parent_path()) {
            if (!dirs.insert(d.string()).second) break;
        }
    }
    for (auto d = dirs.rbegin(); d != dirs.rend(); ++d) {
        const fs::path full = fs::path(set.root) / *d;
        std::error_code ec;
        if (fs::is_empty(full, ec) && !ec) fs::remove(full, ec);
    }

    LogInfo("Removed %zu archived files from %s", removed, set.root.c_str());
}

} // namespace coldstash
