#include "util/config.hpp"

#include "coldstash/manifest_index.hpp"
#include "coldstash/storage_tier.hpp"
#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace coldstash::config {

std::string CurrentUserName() {
    if (const passwd* pw = ::getpwuid(::geteuid()); pw && pw->pw_name) {
        return pw->pw_name;
    }
    return "uid" + std::to_string(::geteuid());
}

void Config::Reset() {
    *this = Config{};
}

Result Config::LoadString(const std::string& json_text) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(json_text, json, err) || !detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorCode::InvalidConfig, "Config: " + err);
    }
    if (owner.empty()) owner = CurrentUserName();
    return Validate();
}

Result Config::LoadFile(const std::string& path, bool must_exist) {
    Reset();

    const std::string expanded = ExpandUser(path);
    std::error_code ec;
    if (!std::filesystem::exists(expanded, ec)) {
        if (must_exist) return Result::Fail(ErrorCode::InvalidConfig, "Config: cannot open " + expanded);
        owner = CurrentUserName();
        return Result::Ok();
    }

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(expanded, json, err)) {
        return Result::Fail(ErrorCode::InvalidConfig, "Config: " + err);
    }
    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorCode::InvalidConfig, "Config: " + err + " in " + expanded);
    }
    if (owner.empty()) owner = CurrentUserName();
    if (!index_db.empty()) index_db = ExpandUser(index_db);
    return Validate();
}

Result Config::Validate() const {
    auto bad = [](const std::string& what) { return Result::Fail(ErrorCode::InvalidConfig, "Config: " + what); };

    if (artifact_prefix.empty() || artifact_prefix.find('/') != std::string::npos) {
        return bad("'artifact_prefix' must be a non-empty file name prefix");
    }
    if (!IsSqlIdentifier(index_table)) return bad("'index_table' is not a valid table name: " + index_table);
    if (!IsValidStorageClass(cold_storage.storage_class)) {
        return bad("unknown 'storage_class': " + cold_storage.storage_class);
    }
    const auto& tier = cold_storage.restore_tier;
    if (tier != "Bulk" && tier != "Standard" && tier != "Expedited") {
        return bad("'restore_tier' must be Bulk, Standard or Expedited");
    }
    if (cold_storage.restore_days < 1) return bad("'restore_days' must be at least 1");
    if (cold_storage.max_concurrency == 0) return bad("'max_concurrency' must be at least 1");
    if (cold_storage.multipart_chunk_bytes < 5ULL * 1024 * 1024) {
        return bad("'multipart_chunk_bytes' must be at least 5 MiB");
    }
    if (restore.poll_interval_seconds == 0) return bad("'poll_interval_seconds' must be positive");
    return Result::Ok();
}

Result Config::ValidateFor(LocationKind kind) const {
    switch (kind) {
        case LocationKind::ColdStorage:
            if (cold_storage.bucket.empty()) {
                return Result::Fail(ErrorCode::InvalidConfig, "Config: cold_storage.bucket is not set");
            }
            break;
        case LocationKind::RemoteArchive:
            if (remote_archive.endpoint.empty() || remote_archive.path.empty()) {
                return Result::Fail(ErrorCode::InvalidConfig,
                                    "Config: remote_archive.endpoint and remote_archive.path are required");
            }
            break;
        case LocationKind::DryRun:
            break;
    }
    return Result::Ok();
}

} // namespace coldstash::config
