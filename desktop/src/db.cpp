#include "curvetrack/db.hpp"
#if CURVETRACK_DESKTOP_SQLITE
#include <stdexcept>
#include <string>

namespace curvetrack {

static void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

SqliteStorage::SqliteStorage(const std::string& db_path) : db_path_(db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        throw std::runtime_error("failed to open sqlite database " + db_path + ": " + msg);
    }
    try {
        exec_or_throw(db_, "PRAGMA journal_mode=WAL;");
        exec_or_throw(db_, "PRAGMA synchronous=NORMAL;");
        exec_or_throw(db_, "CREATE TABLE IF NOT EXISTS revisions("
                           "id INTEGER PRIMARY KEY AUTOINCREMENT,"
                           " label TEXT NOT NULL,"
                           " diff_json TEXT NOT NULL,"
                           " created_at INTEGER)");
    } catch (...) {
        sqlite3_close(db_);
        throw;
    }
}

SqliteStorage::~SqliteStorage() {
    if (db_) sqlite3_close(db_);
}

void SqliteStorage::begin() { exec_or_throw(db_, "BEGIN"); }
void SqliteStorage::commit() { exec_or_throw(db_, "COMMIT"); }
void SqliteStorage::rollback() { exec_or_throw(db_, "ROLLBACK"); }

void SqliteStorage::addRevision(const RevisionRecord& r) {
    sqlite3_stmt* stmt = nullptr;
    const char* sql = "INSERT INTO revisions(label, diff_json, created_at)"
                      " VALUES(?, ?, CAST(strftime('%s','now') AS INTEGER))";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare failed for insert revision");
    }
    sqlite3_bind_text(stmt, 1, r.label.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, r.diff_json.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        sqlite3_finalize(stmt);
        throw std::runtime_error("insert revision failed");
    }
    sqlite3_finalize(stmt);
}

std::vector<RevisionRecord> SqliteStorage::readRevisions() const {
    std::vector<RevisionRecord> out;
    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT label, diff_json FROM revisions ORDER BY id ASC";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare failed for select revisions");
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* lbl = sqlite3_column_text(stmt, 0);
        const unsigned char* diff = sqlite3_column_text(stmt, 1);
        RevisionRecord r;
        r.label = lbl ? reinterpret_cast<const char*>(lbl) : "";
        r.diff_json = diff ? reinterpret_cast<const char*>(diff) : "";
        out.emplace_back(std::move(r));
    }
    sqlite3_finalize(stmt);
    return out;
}

int SqliteStorage::revisionCount() const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM revisions", -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare failed for count revisions");
    }
    int n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) n = sqlite3_column_int(stmt, 0);
    sqlite3_finalize(stmt);
    return n;
}

} // namespace curvetrack
#endif
