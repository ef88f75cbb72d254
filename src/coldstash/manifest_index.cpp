#include "coldstash/manifest_index.hpp"

#include "util/logger.hpp"

#include <sqlite3.h>

#include <cctype>

namespace coldstash {

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* s) const {
        if (s) sqlite3_finalize(s);
    }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

constexpr const char* kColumns =
    "record, id, timestamp, location, filename, localPath, archivePath, "
    "file, size, fingerprint, bundleFingerprint, owner";

std::string ColumnText(sqlite3_stmt* s, int col) {
    const unsigned char* p = sqlite3_column_text(s, col);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
}

void BindText(sqlite3_stmt* s, int idx, std::string_view v) {
    sqlite3_bind_text(s, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

} // namespace

std::vector<IndexRow> RowsFromManifest(const Manifest& m) {
    std::vector<IndexRow> rows;
    rows.reserve(m.files.size());
    for (const auto& f : m.files) {
        IndexRow row;
        row.id = m.id;
        row.timestamp = m.timestamp;
        row.location = LocationKindName(m.location);
        row.filename = m.filename;
        row.local_path = m.local_path;
        row.archive_path = m.archive_path;
        row.file = f.path;
        row.size = f.size;
        row.fingerprint = f.fingerprint;
        row.bundle_fingerprint = m.bundle_fingerprint;
        row.owner = m.owner;
        rows.push_back(std::move(row));
    }
    return rows;
}

bool IsSqlIdentifier(std::string_view s) {
    if (s.empty()) return false;
    const unsigned char first = static_cast<unsigned char>(s.front());
    if (!(std::isalpha(first) || first == '_')) return false;
    for (unsigned char c : s) {
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

Result SqliteManifestIndex::Open(const std::string& db_path,
                                 const std::string& table,
                                 std::unique_ptr<SqliteManifestIndex>& out) {
    if (!IsSqlIdentifier(table)) {
        return Result::Fail(ErrorCode::InvalidConfig, "invalid index table name: " + table);
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(db_path.c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        const std::string em = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) sqlite3_close(db);
        return Result::Fail(ErrorCode::IndexError, "cannot open index " + db_path + ": " + em);
    }
    sqlite3_busy_timeout(db, 5000);

    out.reset(new SqliteManifestIndex(db, table));
    return Result::Ok();
}

SqliteManifestIndex::~SqliteManifestIndex() {
    if (db_) sqlite3_close(db_);
}

Result SqliteManifestIndex::Fail(const std::string& what) const {
    return Result::Fail(ErrorCode::IndexError, what + ": " + sqlite3_errmsg(db_));
}

Result SqliteManifestIndex::Exec(const std::string& sql) {
    char* err_msg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg) != SQLITE_OK) {
        const std::string msg = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        return Result::Fail(ErrorCode::IndexError, "SQL error: " + msg);
    }
    return Result::Ok();
}

Result SqliteManifestIndex::CreateTable() {
    return Exec("CREATE TABLE IF NOT EXISTS " + table_ + " ("
                "record INTEGER PRIMARY KEY AUTOINCREMENT, "
                "id TEXT NOT NULL, "
                "timestamp TEXT NOT NULL, "
                "location TEXT NOT NULL, "
                "filename TEXT NOT NULL, "
                "localPath TEXT NOT NULL, "
                "archivePath TEXT NOT NULL, "
                "file TEXT NOT NULL, "
                "size INTEGER NOT NULL, "
                "fingerprint TEXT NOT NULL, "
                "bundleFingerprint TEXT NOT NULL, "
                "owner TEXT NOT NULL);");
}

Result SqliteManifestIndex::DeleteArchive(const std::string& id) {
    const std::string sql = "DELETE FROM " + table_ + " WHERE id = ?;";
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) return Fail("prepare delete");
    Stmt stmt(raw);
    BindText(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) return Fail("delete rows of " + id);
    LogDebug("index: dropped %d rows of %s", sqlite3_changes(db_), id.c_str());
    return Result::Ok();
}

Result SqliteManifestIndex::InsertInTransaction(const std::vector<IndexRow>& rows) {
    const std::string sql = "INSERT INTO " + table_ +
                            " (id, timestamp, location, filename, localPath, archivePath, file, size, "
                            "fingerprint, bundleFingerprint, owner) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) return Fail("prepare insert");
    Stmt stmt(raw);

    for (const auto& row : rows) {
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
        BindText(stmt.get(), 1, row.id);
        BindText(stmt.get(), 2, row.timestamp);
        BindText(stmt.get(), 3, row.location);
        BindText(stmt.get(), 4, row.filename);
        BindText(stmt.get(), 5, row.local_path);
        BindText(stmt.get(), 6, row.archive_path);
        BindText(stmt.get(), 7, row.file);
        sqlite3_bind_int64(stmt.get(), 8, static_cast<sqlite3_int64>(row.size));
        BindText(stmt.get(), 9, row.fingerprint);
        BindText(stmt.get(), 10, row.bundle_fingerprint);
        BindText(stmt.get(), 11, row.owner);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) return Fail("insert " + row.file);
    }
    LogDebug("index: inserted %zu rows into %s", rows.size(), table_.c_str());
    return Result::Ok();
}

Result SqliteManifestIndex::InsertRows(const std::vector<IndexRow>& rows) {
    if (rows.empty()) return Result::Ok();

    auto r = Exec("BEGIN IMMEDIATE;");
    if (!r.is_ok()) return r;
    r = InsertInTransaction(rows);
    if (r.is_ok()) r = Exec("COMMIT;");
    if (!r.is_ok()) {
        (void)Exec("ROLLBACK;");
        return r;
    }
    return Result::Ok();
}

Result SqliteManifestIndex::ReplaceArchive(const std::string& id, const std::vector<IndexRow>& rows) {
    auto r = Exec("BEGIN IMMEDIATE;");
    if (!r.is_ok()) return r;
    r = DeleteArchive(id);
    if (r.is_ok()) r = InsertInTransaction(rows);
    if (r.is_ok()) r = Exec("COMMIT;");
    if (!r.is_ok()) {
        (void)Exec("ROLLBACK;");
        return r;
    }
    return Result::Ok();
}

Result SqliteManifestIndex::Select(const std::string& where, std::string_view arg, std::vector<IndexRow>& out) {
    out.clear();
    const std::string sql = std::string("SELECT ") + kColumns + " FROM " + table_ + where + " ORDER BY record;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Fail("prepare select");
    }
    Stmt stmt(raw);
    if (!where.empty()) BindText(stmt.get(), 1, arg);

    while (true) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) return Fail("select");

        IndexRow row;
        row.record = sqlite3_column_int64(stmt.get(), 0);
        row.id = ColumnText(stmt.get(), 1);
        row.timestamp = ColumnText(stmt.get(), 2);
        row.location = ColumnText(stmt.get(), 3);
        row.filename = ColumnText(stmt.get(), 4);
        row.local_path = ColumnText(stmt.get(), 5);
        row.archive_path = ColumnText(stmt.get(), 6);
        row.file = ColumnText(stmt.get(), 7);
        row.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 8));
        row.fingerprint = ColumnText(stmt.get(), 9);
        row.bundle_fingerprint = ColumnText(stmt.get(), 10);
        row.owner = ColumnText(stmt.get(), 11);
        out.push_back(std::move(row));
    }
    return Result::Ok();
}

Result SqliteManifestIndex::SelectAll(std::vector<IndexRow>& out) {
    return Select("", {}, out);
}

Result SqliteManifestIndex::FindByFile(std::string_view needle, std::vector<IndexRow>& out) {
    // '%' and '_' in the needle are matched literally
    std::string pattern = "%";
    for (char c : needle) {
        if (c == '%' || c == '_' || c == '\\') pattern.push_back('\\');
        pattern.push_back(c);
    }
    pattern.push_back('%');
    return Select(" WHERE file LIKE ? ESCAPE '\\'", pattern, out);
}

} // namespace coldstash
