#pragma once

#include "curvetrack/command.hpp"
#if CURVETRACK_DESKTOP_SQLITE
#include <sqlite3.h>
#endif
#include <string>
#include <vector>

namespace curvetrack {

// Revision journal in a SQLite database. The revisions table is created on
// open if it does not exist.
class SqliteStorage : public IStorage {
public:
#if CURVETRACK_DESKTOP_SQLITE
    explicit SqliteStorage(const std::string& db_path);
    ~SqliteStorage() override;
    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;
    void begin() override;
    void commit() override;
    void rollback() override;
    void addRevision(const RevisionRecord& r) override;
    std::vector<RevisionRecord> readRevisions() const;
    int revisionCount() const;
    // Utilities
    const std::string& dbPath() const { return db_path_; }
private:
    std::string db_path_;
    sqlite3* db_ {nullptr};
#else
    explicit SqliteStorage(const std::string&) {}
    void begin() override {}
    void commit() override {}
    void rollback() override {}
    void addRevision(const RevisionRecord&) override {}
    std::vector<RevisionRecord> readRevisions() const { return {}; }
    int revisionCount() const { return 0; }
#endif
};

} // namespace curvetrack
