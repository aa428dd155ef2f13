#include "sqlite_schema.hpp"

#include <memory>

#include "internal/db/sql/bootstrap.hpp"

namespace archstore::db::sqlite {
namespace {

class SqliteDdlExecutor final : public sql::DdlExecutor {
 public:
  explicit SqliteDdlExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

void BindAndStep(SqliteDB& db, const char* sql, const std::string& key, const std::string& value) {
  sqlite3_stmt* raw = nullptr;
  int           rc  = sqlite3_prepare_v2(db.Handle(), sql, -1, &raw, nullptr);
  std::unique_ptr<sqlite3_stmt, StmtDeleter> st(raw);
  if (rc != SQLITE_OK) ThrowSqliteError(db.Handle(), rc, "prepare schema_version write");

  sqlite3_bind_text(st.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT);
  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowSqliteError(db.Handle(), rc, "write schema_version");
}

} // namespace

void BootstrapStore(SqliteDB& db, const std::string& schema_version) {
  std::lock_guard lock(db.TxMutex());

  db.Exec("BEGIN IMMEDIATE;");
  try {
    SqliteDdlExecutor executor(db);
    sql::RunBootstrap(executor, sql::StoreLayoutDdl());
    sql::RunBootstrap(executor, sql::StoreLayoutChecks());
    BindAndStep(db, "INSERT OR IGNORE INTO store_metadata(key,value) VALUES(?,?);", kSchemaVersionKey, schema_version);
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }
}

void WriteSchemaVersion(SqliteDB& db, const std::string& schema_version) {
  std::lock_guard lock(db.TxMutex());
  BindAndStep(db,
              "INSERT INTO store_metadata(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;",
              kSchemaVersionKey,
              schema_version);
}

std::optional<std::string> ReadSchemaVersion(SqliteDB& db) {
  std::lock_guard lock(db.TxMutex());

  sqlite3_stmt* raw = nullptr;
  int rc = sqlite3_prepare_v2(db.Handle(), "SELECT value FROM store_metadata WHERE key=?;", -1, &raw, nullptr);
  std::unique_ptr<sqlite3_stmt, StmtDeleter> st(raw);
  if (rc != SQLITE_OK) {
    // no metadata table: store predates version tagging
    return std::nullopt;
  }

  sqlite3_bind_text(st.get(), 1, kSchemaVersionKey, -1, SQLITE_STATIC);
  rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) {
    const unsigned char* text = sqlite3_column_text(st.get(), 0);
    return std::string(text ? reinterpret_cast<const char*>(text) : "");
  }
  if (rc != SQLITE_DONE) ThrowSqliteError(db.Handle(), rc, "read schema_version");
  return std::nullopt;
}

} // namespace archstore::db::sqlite
