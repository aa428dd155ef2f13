#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace archstore::db::sqlite {

/*
  SQLite transaction wrapper.

  Writes use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Reads use BEGIN DEFERRED.

  Holds the connection's transaction mutex until destroyed.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode {
    kWrite,
    kRead,
  };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kWrite);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  SqliteDB& Database() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
};

}
