#pragma once

#include "coldstash/file_entry.hpp"

#include <ctime>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace coldstash {

enum class LocationKind {
    ColdStorage,
    RemoteArchive,
    DryRun,
};

// "cold_storage", "remote_archive", "dry_run"
const char* LocationKindName(LocationKind kind);
std::optional<LocationKind> ParseLocationKind(std::string_view s);

// Durable record of one archive operation. Serialized as the sidecar JSON
// object {id, timestamp, location, filename, localPath, archivePath, files,
// bundleFingerprint, owner}.
struct Manifest {
    std::string id;
    std::string timestamp;     // "YYYY-MM-DD HH:MM:SS", local time
    LocationKind location = LocationKind::ColdStorage;
    std::string filename;      // bundle file name
    std::string local_path;    // archive root
    std::string archive_path;  // bucket or remote directory; empty for dry runs
    FileList files;
    std::string bundle_fingerprint;
    std::string owner;

    bool operator==(const Manifest&) const = default;
};

std::string FormatTimestamp(std::time_t t);

std::string ManifestToJson(const Manifest& m);

class ManifestParser {
  public:
    // Parses and validates a sidecar document; the error names the first
    // offending field.
    std::expected<Manifest, std::string> Parse(const std::string& json_input) const;
};

} // namespace coldstash
