#include "util/config_json_utils.hpp"

#include <fstream>
#include <limits>

namespace coldstash::config::detail {

namespace {

// Each getter leaves `out` untouched when the key is absent and fails only
// when the value has the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_number_unsigned()) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

template <typename T>
bool GetSmallIfPresent(const nlohmann::json& j, const char* key, T& out, std::string& err) {
    std::uint64_t v = out;
    if (!GetU64IfPresent(j, key, v, err))
        return false;
    if (v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        err = std::string("'") + key + "' is out of range";
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

const nlohmann::json* SectionIfPresent(const nlohmann::json& j, const char* key, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return nullptr;
    if (!it->is_object()) {
        err = std::string("'") + key + "' must be an object";
        return nullptr;
    }
    return &*it;
}

} // namespace

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, Config& cfg, std::string& err) {
    std::string integrity;
    std::string level;
    if (!GetStringIfPresent(j, "artifact_prefix", cfg.artifact_prefix, err) ||
        !GetStringIfPresent(j, "owner", cfg.owner, err) ||
        !GetStringIfPresent(j, "index_db", cfg.index_db, err) ||
        !GetStringIfPresent(j, "index_table", cfg.index_table, err) ||
        !GetSmallIfPresent(j, "hash_workers", cfg.hash_workers, err) ||
        !GetU64IfPresent(j, "max_source_bytes", cfg.max_source_bytes, err) ||
        !GetStringIfPresent(j, "integrity_mode", integrity, err) ||
        !GetStringIfPresent(j, "log_level", level, err)) {
        return false;
    }

    if (!integrity.empty()) {
        auto mode = ParseIntegrityMode(integrity);
        if (!mode) {
            err = "'integrity_mode' must be \"path\" or \"set\"";
            return false;
        }
        cfg.integrity_mode = *mode;
    }
    if (!level.empty()) {
        auto lvl = ParseLogLevel(level);
        if (!lvl) {
            err = "unknown 'log_level': " + level;
            return false;
        }
        cfg.log_level = *lvl;
    }

    if (const auto* cs = SectionIfPresent(j, "cold_storage", err)) {
        auto& c = cfg.cold_storage;
        if (!GetStringIfPresent(*cs, "bucket", c.bucket, err) ||
            !GetStringIfPresent(*cs, "region", c.region, err) ||
            !GetStringIfPresent(*cs, "storage_class", c.storage_class, err) ||
            !GetU64IfPresent(*cs, "multipart_threshold_bytes", c.multipart_threshold_bytes, err) ||
            !GetU64IfPresent(*cs, "multipart_chunk_bytes", c.multipart_chunk_bytes, err) ||
            !GetSmallIfPresent(*cs, "max_concurrency", c.max_concurrency, err) ||
            !GetSmallIfPresent(*cs, "restore_days", c.restore_days, err) ||
            !GetStringIfPresent(*cs, "restore_tier", c.restore_tier, err) ||
            !GetStringIfPresent(*cs, "cli", c.cli, err)) {
            return false;
        }
    } else if (!err.empty()) {
        return false;
    }

    if (const auto* ra = SectionIfPresent(j, "remote_archive", err)) {
        auto& r = cfg.remote_archive;
        if (!GetStringIfPresent(*ra, "endpoint", r.endpoint, err) ||
            !GetStringIfPresent(*ra, "local_endpoint", r.local_endpoint, err) ||
            !GetStringIfPresent(*ra, "path", r.path, err) ||
            !GetStringIfPresent(*ra, "cli", r.cli, err)) {
            return false;
        }
    } else if (!err.empty()) {
        return false;
    }

    if (const auto* rs = SectionIfPresent(j, "restore", err)) {
        if (!GetU64IfPresent(*rs, "poll_interval_seconds", cfg.restore.poll_interval_seconds, err) ||
            !GetU64IfPresent(*rs, "deadline_seconds", cfg.restore.deadline_seconds, err)) {
            return false;
        }
    } else if (!err.empty()) {
        return false;
    }

    return true;
}

} // namespace coldstash::config::detail
