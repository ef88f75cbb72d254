#include "coldstash/manifest.hpp"

#include "coldstash/archive_path_policy.hpp"
#include "coldstash/artifact_naming.hpp"
#include "crypto/sha256.hpp"

#include <nlohmann/json.hpp>

namespace coldstash {

using json = nlohmann::json;

namespace {

std::expected<std::string, std::string> RequireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::unexpected(std::string("missing '") + key + "'");
    if (!it->is_string()) return std::unexpected(std::string("'") + key + "' must be a string");
    return it->get<std::string>();
}

std::expected<FileList, std::string> ParseFilesArray(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'files' must be an array");
    }

    FileList out;
    out.reserve(arr.size());

    for (const auto& item : arr) {
        if (!item.is_object()) return std::unexpected("'files' entries must be objects");

        FileEntry f;
        auto path = RequireString(item, "path");
        if (!path) return std::unexpected("file entry: " + path.error());
        f.path = std::move(*path);
        if (!ArchivePathPolicy::IsSafeRelativePath(f.path)) {
            return std::unexpected("file entry has unsafe path: " + f.path);
        }

        auto size = item.find("size");
        if (size == item.end() || !size->is_number_unsigned()) {
            return std::unexpected("file entry " + f.path + ": 'size' must be a non-negative integer");
        }
        f.size = size->get<std::uint64_t>();

        auto fp = RequireString(item, "fingerprint");
        if (!fp) return std::unexpected("file entry " + f.path + ": " + fp.error());
        if (!IsFingerprint(*fp)) return std::unexpected("file entry " + f.path + ": malformed fingerprint");
        f.fingerprint = std::move(*fp);

        out.push_back(std::move(f));
    }

    return out;
}

} // namespace

const char* LocationKindName(LocationKind kind) {
    switch (kind) {
        case LocationKind::ColdStorage:   return "cold_storage";
        case LocationKind::RemoteArchive: return "remote_archive";
        case LocationKind::DryRun:        return "dry_run";
    }
    return "unknown";
}

std::optional<LocationKind> ParseLocationKind(std::string_view s) {
    if (s == "cold_storage") return LocationKind::ColdStorage;
    if (s == "remote_archive") return LocationKind::RemoteArchive;
    if (s == "dry_run") return LocationKind::DryRun;
    return std::nullopt;
}

std::string FormatTimestamp(std::time_t t) {
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::string ManifestToJson(const Manifest& m) {
    // ordered_json keeps the documented key order in the sidecar
    nlohmann::ordered_json files = nlohmann::ordered_json::array();
    for (const auto& f : m.files) {
        files.push_back({{"path", f.path}, {"size", f.size}, {"fingerprint", f.fingerprint}});
    }

    nlohmann::ordered_json j;
    j["id"] = m.id;
    j["timestamp"] = m.timestamp;
    j["location"] = LocationKindName(m.location);
    j["filename"] = m.filename;
    j["localPath"] = m.local_path;
    j["archivePath"] = m.archive_path;
    j["files"] = files;
    j["bundleFingerprint"] = m.bundle_fingerprint;
    j["owner"] = m.owner;
    return j.dump(2) + "\n";
}

std::expected<Manifest, std::string> ManifestParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        Manifest m;

        auto id = RequireString(j, "id");
        if (!id) return std::unexpected(id.error());
        if (id->size() != kArchiveIdLength || !IsValidArchiveId(*id)) {
            return std::unexpected("malformed archive id: " + *id);
        }
        m.id = std::move(*id);

        auto ts = RequireString(j, "timestamp");
        if (!ts) return std::unexpected(ts.error());
        m.timestamp = std::move(*ts);

        auto loc = RequireString(j, "location");
        if (!loc) return std::unexpected(loc.error());
        auto kind = ParseLocationKind(*loc);
        if (!kind) return std::unexpected("unknown location kind: " + *loc);
        m.location = *kind;

        auto filename = RequireString(j, "filename");
        if (!filename) return std::unexpected(filename.error());
        if (filename->empty() || filename->find('/') != std::string::npos) {
            return std::unexpected("malformed bundle filename: " + *filename);
        }
        m.filename = std::move(*filename);

        auto local = RequireString(j, "localPath");
        if (!local) return std::unexpected(local.error());
        m.local_path = std::move(*local);

        auto remote = RequireString(j, "archivePath");
        if (!remote) return std::unexpected(remote.error());
        if (remote->empty() && m.location != LocationKind::DryRun) {
            return std::unexpected("'archivePath' is empty");
        }
        m.archive_path = std::move(*remote);

        if (!j.contains("files")) return std::unexpected("missing 'files'");
        auto files = ParseFilesArray(j["files"]);
        if (!files) return std::unexpected(files.error());
        if (files->empty()) return std::unexpected("'files' is empty");
        m.files = std::move(*files);

        auto bundle_fp = RequireString(j, "bundleFingerprint");
        if (!bundle_fp) return std::unexpected(bundle_fp.error());
        if (!IsFingerprint(*bundle_fp)) return std::unexpected("malformed bundleFingerprint");
        m.bundle_fingerprint = std::move(*bundle_fp);

        auto owner = RequireString(j, "owner");
        if (!owner) return std::unexpected(owner.error());
        m.owner = std::move(*owner);

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace coldstash
