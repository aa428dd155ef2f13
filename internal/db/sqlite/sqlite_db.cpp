#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace archstore::db::sqlite {

void ThrowSqliteError(sqlite3* db, int rc, const std::string& what) {
  const std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  switch (rc & 0xFF) {
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_READONLY:
    case SQLITE_PERM:
      throw util::StorageIOError(msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      throw util::CorruptionError(msg);
    default:
      throw util::InvalidState(msg);
  }
}

SqliteDB::SqliteDB(std::string path, OpenMode mode) : path_(std::move(path)), mode_(mode) {
  const int flags = mode_ == OpenMode::kReadOnly ? SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX
                                                 : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageIOError("cannot open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    ThrowSqliteError(nullptr, rc, msg);
  }
}

void SqliteDB::Configure() {
  if (mode_ == OpenMode::kReadWrite) {
    // WAL enables concurrent readers while writer holds lock
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  int rc = sqlite3_busy_timeout(db_, 5000);
  if (rc != SQLITE_OK) ThrowSqliteError(db_, rc, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

void SqliteDB::Checkpoint() {
  if (mode_ == OpenMode::kReadOnly) return;
  std::lock_guard lock(tx_mutex_);
  Exec("PRAGMA wal_checkpoint(TRUNCATE);");
}

} // namespace archstore::db::sqlite
