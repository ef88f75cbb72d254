#pragma once

#include "coldstash/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace coldstash {

// One row per (manifest, file) pair; manifest scalars are repeated.
struct IndexRow {
    std::int64_t record = 0; // assigned by the store
    std::string id;
    std::string timestamp;
    std::string location;
    std::string filename;
    std::string local_path;
    std::string archive_path;
    std::string file;
    std::uint64_t size = 0;
    std::string fingerprint;
    std::string bundle_fingerprint;
    std::string owner;
};

std::vector<IndexRow> RowsFromManifest(const Manifest& m);

class IManifestIndex {
  public:
    virtual ~IManifestIndex() = default;

    virtual Result CreateTable() = 0;
    virtual Result InsertRows(const std::vector<IndexRow>& rows) = 0;
    // Drops every row recorded under `id` and inserts `rows`, atomically.
    virtual Result ReplaceArchive(const std::string& id, const std::vector<IndexRow>& rows) = 0;
    virtual Result SelectAll(std::vector<IndexRow>& out) = 0;
    // Rows whose file path contains `needle`.
    virtual Result FindByFile(std::string_view needle, std::vector<IndexRow>& out) = 0;
};

// [A-Za-z_][A-Za-z0-9_]*
bool IsSqlIdentifier(std::string_view s);

class SqliteManifestIndex final : public IManifestIndex {
  public:
    // `db_path` may be ":memory:".
    static Result Open(const std::string& db_path, const std::string& table,
                       std::unique_ptr<SqliteManifestIndex>& out);

    SqliteManifestIndex(const SqliteManifestIndex&) = delete;
    SqliteManifestIndex& operator=(const SqliteManifestIndex&) = delete;
    ~SqliteManifestIndex() override;

    Result CreateTable() override;
    Result InsertRows(const std::vector<IndexRow>& rows) override;
    Result ReplaceArchive(const std::string& id, const std::vector<IndexRow>& rows) override;
    Result SelectAll(std::vector<IndexRow>& out) override;
    Result FindByFile(std::string_view needle, std::vector<IndexRow>& out) override;

  private:
    SqliteManifestIndex(sqlite3* db, std::string table) : db_(db), table_(std::move(table)) {}

    Result Exec(const std::string& sql);
    // Runs inside a transaction opened by the caller.
    Result DeleteArchive(const std::string& id);
    Result InsertInTransaction(const std::vector<IndexRow>& rows);
    Result Select(const std::string& where, std::string_view arg, std::vector<IndexRow>& out);
    Result Fail(const std::string& what) const;

    sqlite3* db_ = nullptr;
    std::string table_;
};

} // namespace coldstash
