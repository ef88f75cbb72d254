#include "coldstash/manifest_store.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace coldstash {

Result ManifestStore::ListSidecars(const std::string& dir, std::vector<std::string>& out) const {
    out.clear();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result::Fail(ErrorCode::InvalidInputPath, "'" + dir + "' is not a directory");
    }

    struct Candidate {
        fs::file_time_type mtime;
        std::string name;
        std::string path;
    };
    std::vector<Candidate> found;

    for (fs::directory_iterator it(dir, ec), end; it != end; it.increment(ec)) {
        if (ec) break;
        const auto name = it->path().filename().string();
        if (!naming_.IsSidecarName(name)) continue;
        if (!it->is_regular_file(ec)) continue;
        const auto mtime = it->last_write_time(ec);
        if (ec) return Result::Fail(ec.value(), "stat " + it->path().string() + ": " + ec.message());
        found.push_back({mtime, name, it->path().string()});
    }
    if (ec) return Result::Fail(ec.value(), "cannot list " + dir + ": " + ec.message());

    std::sort(found.begin(), found.end(), [](const Candidate& a, const Candidate& b) {
        if (a.mtime != b.mtime) return a.mtime > b.mtime;
        return a.name > b.name;
    });
    for (auto& c : found) out.push_back(std::move(c.path));
    return Result::Ok();
}

Result ManifestStore::Create(const std::string& root, const CreateOptions& opt, std::string& out_id) const {
    std::vector<std::string> existing;
    auto r = ListSidecars(root, existing);
    if (!r.is_ok()) return r;

    if (!existing.empty()) {
        const std::string newest = fs::path(existing.front()).filename().string();
        if (opt.overwrite) {
            out_id = naming_.ExtractId(newest);
            LogInfo("Overwriting archive %s in %s", out_id.c_str(), root.c_str());
            return Result::Ok();
        }
        if (!opt.force) {
            return Result::Fail(ErrorCode::DuplicateArchiveExists,
                                "'" + root + "' already archived (" + newest +
                                    "); pass force or overwrite to archive again");
        }
        LogWarn("Creating an additional archive next to %s", newest.c_str());
    }

    return GenerateArchiveId(out_id);
}

Result ManifestStore::Persist(const Manifest& m) const {
    if (!IsValidArchiveId(m.id)) {
        return Result::Fail(ErrorCode::InvalidManifest, "refusing to persist manifest without a valid id");
    }

    const std::string path = (fs::path(m.local_path) / naming_.SidecarName(m.id)).string();
    const std::string doc = ManifestToJson(m);
    auto r = WriteFileAtomically(
        path, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(doc.data()), doc.size()));
    if (!r.is_ok()) return r;
    LogInfo("Wrote manifest %s", path.c_str());

    if (!index_) {
        LogWarn("No manifest index configured; %s is recorded in its sidecar only", m.id.c_str());
        return Result::Ok();
    }

    r = index_->CreateTable();
    if (r.is_ok()) r = index_->ReplaceArchive(m.id, RowsFromManifest(m));
    if (!r.is_ok()) {
        return Result::Fail(ErrorCode::IndexError,
                            "sidecar " + path + " written but index update failed: " + r.msg);
    }
    return Result::Ok();
}

Result ManifestStore::Load(const std::string& dir, Manifest& out) const {
    std::vector<std::string> sidecars;
    auto r = ListSidecars(dir, sidecars);
    if (!r.is_ok()) return r;
    if (sidecars.empty()) {
        return Result::Fail(ErrorCode::InvalidInputPath, "no archive manifest found in " + dir);
    }
    if (sidecars.size() > 1) {
        LogInfo("%zu manifests in %s; using the newest", sidecars.size(), dir.c_str());
    }

    const std::string& path = sidecars.front();
    std::ifstream is(path);
    if (!is.good()) return Result::Fail(errno, "cannot open " + path);
    std::stringstream ss;
    ss << is.rdbuf();

    auto parsed = ManifestParser{}.Parse(ss.str());
    if (!parsed) {
        return Result::Fail(ErrorCode::InvalidManifest, path + ": " + parsed.error());
    }
    if (naming_.ExtractId(fs::path(path).filename().string()) != parsed->id) {
        return Result::Fail(ErrorCode::InvalidManifest, path + ": id does not match the file name");
    }

    out = std::move(*parsed);
    return Result::Ok();
}

} // namespace coldstash
