#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace archstore::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per store file. Transactions on the connection are
  serialized through TxMutex(); SqliteTransaction holds it for its lifetime.
*/
class SqliteDB {
 public:
  enum class OpenMode {
    kReadWrite,
    kReadOnly,
  };

  explicit SqliteDB(std::string path, OpenMode mode = OpenMode::kReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Folds the WAL into the main file and truncates it.
  void Checkpoint();

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
  std::mutex  tx_mutex_;
};

// Throws StorageIOError for I/O class codes, CorruptionError for corrupt
// files and InvalidState otherwise.
[[noreturn]] void ThrowSqliteError(sqlite3* db, int rc, const std::string& what);

} // namespace archstore::db::sqlite
