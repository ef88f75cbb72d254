#pragma once

#include "coldstash/integrity_verifier.hpp"
#include "coldstash/manifest.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace coldstash::config {

inline constexpr const char* kDefaultConfigPath = "~/.coldstash.json";

struct ColdStorageConfig {
    std::string bucket;
    std::string region;
    std::string storage_class = "DEEP_ARCHIVE";
    std::uint64_t multipart_threshold_bytes = 25ULL * 1024 * 1024;
    std::uint64_t multipart_chunk_bytes = 25ULL * 1024 * 1024;
    unsigned max_concurrency = 10;
    int restore_days = 7;
    std::string restore_tier = "Bulk";
    std::string cli = "aws";
};

struct RemoteArchiveConfig {
    std::string endpoint;
    std::string local_endpoint; // empty => same as endpoint
    std::string path;
    std::string cli = "globus";
};

struct RestoreConfig {
    std::uint64_t poll_interval_seconds = 120;
    std::uint64_t deadline_seconds = 0; // 0 => wait indefinitely
};

// Every setting the tool uses; passed explicitly to the components.
class Config {
public:
    std::string artifact_prefix = "coldstash";
    std::string owner;          // defaults to the current login name
    std::string index_db;       // empty => no index mirror
    std::string index_table = "archives";
    unsigned hash_workers = 0;  // 0 => hardware concurrency, capped
    std::uint64_t max_source_bytes = 2'000'000'000'000ULL;
    IntegrityMode integrity_mode = IntegrityMode::PathKeyed;
    LogLevel log_level = LogLevel::Info;

    ColdStorageConfig cold_storage;
    RemoteArchiveConfig remote_archive;
    RestoreConfig restore;

    // Missing file: defaults when `must_exist` is false, InvalidConfig otherwise.
    Result LoadFile(const std::string& path, bool must_exist);
    Result LoadString(const std::string& json_text);

    Result Validate() const;
    // Settings a backend of `kind` cannot run without.
    Result ValidateFor(LocationKind kind) const;

    void Reset();
};

std::string CurrentUserName();

} // namespace coldstash::config
