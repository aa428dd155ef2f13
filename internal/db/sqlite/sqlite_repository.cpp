#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <limits>
#include <type_traits>

#include "internal/db/sql/sql_params.hpp"

namespace archstore::db::sqlite {

using archstore::db::ErrorCode;
using archstore::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// record_fields.kind
enum FieldKindCode : int {
  kNullField   = 0,
  kIntField    = 1,
  kDoubleField = 2,
  kBoolField   = 3,
  kTextField   = 4,
};

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(st);
    ThrowSqliteError(db, rc, "sqlite prepare");
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindParams(sqlite3_stmt* st, const sql::Params& params, int first = 1) {
  int idx = first;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(st, idx);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(st, idx, v);
          } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(st, idx, v);
          } else {
            BindText(st, idx, v);
          }
        },
        param);
    ++idx;
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// kind, int_value, real_value, text_value
struct EncodedValue {
  int        kind = kNullField;
  sql::Param int_value{nullptr};
  sql::Param real_value{nullptr};
  sql::Param text_value{nullptr};
};

EncodedValue Encode(const model::FieldValue& value) {
  EncodedValue out;
  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          out.kind = kNullField;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          out.kind      = kIntField;
          out.int_value = static_cast<int64_t>(v);
        } else if constexpr (std::is_same_v<T, double>) {
          out.kind       = kDoubleField;
          out.real_value = v;
        } else if constexpr (std::is_same_v<T, bool>) {
          out.kind      = kBoolField;
          out.int_value = static_cast<int64_t>(v ? 1 : 0);
        } else {
          out.kind       = kTextField;
          out.text_value = v;
        }
      },
      value);
  return out;
}

model::FieldValue Decode(sqlite3_stmt* st, int kind_col) {
  switch (ColI32(st, kind_col)) {
    case kIntField:
      return static_cast<std::int64_t>(sqlite3_column_int64(st, kind_col + 1));
    case kDoubleField:
      // NaN is stored as NULL by sqlite
      if (sqlite3_column_type(st, kind_col + 2) == SQLITE_NULL) return std::numeric_limits<double>::quiet_NaN();
      return sqlite3_column_double(st, kind_col + 2);
    case kBoolField:
      return sqlite3_column_int64(st, kind_col + 1) != 0;
    case kTextField:
      return ColText(st, kind_col + 3);
    default:
      return std::monostate{};
  }
}

sql::Statement BuildWhere(const RecordQuery& query) {
  sql::Statement where;
  where.sql = " WHERE 1=1";
  if (query.entity) {
    where.sql += " AND entity=?";
    where.params.emplace_back(*query.entity);
  }
  if (query.project_id) {
    where.sql += " AND project_id=?";
    where.params.emplace_back(*query.project_id);
  }
  if (query.field_equals) {
    const auto& [name, value] = *query.field_equals;
    auto encoded              = Encode(value);
    where.sql += " AND id IN (SELECT record_id FROM record_fields WHERE name=? AND kind=?";
    where.params.emplace_back(name);
    where.params.emplace_back(static_cast<int64_t>(encoded.kind));
    switch (encoded.kind) {
      case kIntField:
      case kBoolField:
        where.sql += " AND int_value=?";
        where.params.push_back(encoded.int_value);
        break;
      case kDoubleField:
        where.sql += " AND real_value=?";
        where.params.push_back(encoded.real_value);
        break;
      case kTextField:
        where.sql += " AND text_value=?";
        where.params.push_back(encoded.text_value);
        break;
      default:
        break;
    }
    where.sql += ")";
  }
  if (query.after_id) {
    where.sql += " AND id>?";
    where.params.emplace_back(*query.after_id);
  }
  return where;
}

std::string LimitClause(const RecordQuery& query) {
  return query.limit ? " LIMIT " + std::to_string(*query.limit) : std::string();
}

model::VersionRecord ReadVersion(sqlite3_stmt* st) {
  model::VersionRecord r;
  r.id             = ColText(st, 0);
  r.project_id     = ColText(st, 1);
  r.version_number = ColU64(st, 2);
  r.type           = static_cast<archstore::v1::VersionType>(ColI32(st, 3));
  r.comment        = ColText(st, 4);
  r.author         = ColText(st, 5);
  r.created_at_ms  = ColU64(st, 6);
  r.data_size      = ColU64(st, 7);
  r.payload        = ColBlob(st, 8);
  r.checksum       = ColText(st, 9);
  return r;
}

constexpr const char* kVersionColumns = "id,project_id,version_number,type,comment,author,created_at_ms,data_size,payload,checksum";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Store metadata
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetStoreValue(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT value FROM store_metadata WHERE key=?;");
  BindText(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ColText(st.get(), 0);
  ThrowIfError(Translate(db, rc), "read store value");
  return std::nullopt;
}

Result SqliteRepository::SetStoreValue(Transaction& t, const std::string& key, const std::string& value) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO store_metadata(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteRepository::WriteFields(sqlite3* db, const model::Record& r) {
  auto st = Prepare(db, "INSERT INTO record_fields(record_id,name,kind,int_value,real_value,text_value) VALUES(?,?,?,?,?,?);");
  for (const auto& [name, value] : r.fields) {
    auto encoded = Encode(value);
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, name);
    BindI32(st.get(), 3, encoded.kind);
    BindParams(st.get(), {encoded.int_value, encoded.real_value, encoded.text_value}, 4);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

Result SqliteRepository::WriteRelationships(sqlite3* db, const model::Record& r) {
  auto st = Prepare(db, "INSERT INTO record_relationships(source_id,position,name,target_id,owning) VALUES(?,?,?,?,?);");
  int  position = 0;
  for (const auto& rel : r.relationships) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, r.id);
    BindI32(st.get(), 2, position++);
    BindText(st.get(), 3, rel.name);
    BindText(st.get(), 4, rel.target_id);
    BindI32(st.get(), 5, rel.owning ? 1 : 0);
    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

Result SqliteRepository::InsertRecord(Transaction& t, const model::Record& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO records(id,entity,project_id,revision,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.entity);
  BindText(st.get(), 3, r.project_id);
  BindU64(st.get(), 4, r.revision);
  BindU64(st.get(), 5, r.created_at_ms);
  BindU64(st.get(), 6, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "record " + r.id + " already exists");
  }
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (auto res = WriteFields(db, r); !res) return res;
  return WriteRelationships(db, r);
}

std::optional<model::Record> SqliteRepository::GetRecord(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT id,entity,project_id,revision,created_at_ms,updated_at_ms FROM records WHERE id=?;");
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIfError(Translate(db, rc), "read record");
    return std::nullopt;
  }

  model::Record r;
  r.id            = ColText(st.get(), 0);
  r.entity        = ColText(st.get(), 1);
  r.project_id    = ColText(st.get(), 2);
  r.revision      = ColU64(st.get(), 3);
  r.created_at_ms = ColU64(st.get(), 4);
  r.updated_at_ms = ColU64(st.get(), 5);

  auto fields = Prepare(db, "SELECT name,kind,int_value,real_value,text_value FROM record_fields WHERE record_id=? ORDER BY name;");
  BindText(fields.get(), 1, id);
  while ((rc = sqlite3_step(fields.get())) == SQLITE_ROW) {
    r.fields[ColText(fields.get(), 0)] = Decode(fields.get(), 1);
  }
  ThrowIfError(Translate(db, rc), "read record fields");

  auto rels = Prepare(db, "SELECT name,target_id,owning FROM record_relationships WHERE source_id=? ORDER BY position;");
  BindText(rels.get(), 1, id);
  while ((rc = sqlite3_step(rels.get())) == SQLITE_ROW) {
    r.relationships.push_back({ColText(rels.get(), 0), ColText(rels.get(), 1), ColI32(rels.get(), 2) != 0});
  }
  ThrowIfError(Translate(db, rc), "read record relationships");

  return r;
}

Result SqliteRepository::UpdateRecord(Transaction& t, const model::Record& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE records SET entity=?,project_id=?,revision=?,updated_at_ms=? WHERE id=?;");
  BindText(st.get(), 1, r.entity);
  BindText(st.get(), 2, r.project_id);
  BindU64(st.get(), 3, r.revision);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindText(st.get(), 5, r.id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "record " + r.id + " not found");

  auto clear_fields = Prepare(db, "DELETE FROM record_fields WHERE record_id=?;");
  BindText(clear_fields.get(), 1, r.id);
  if ((rc = sqlite3_step(clear_fields.get())) != SQLITE_DONE) return Translate(db, rc);

  auto clear_rels = Prepare(db, "DELETE FROM record_relationships WHERE source_id=?;");
  BindText(clear_rels.get(), 1, r.id);
  if ((rc = sqlite3_step(clear_rels.get())) != SQLITE_DONE) return Translate(db, rc);

  if (auto res = WriteFields(db, r); !res) return res;
  return WriteRelationships(db, r);
}

Result SqliteRepository::DeleteRecord(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM records WHERE id=?;");
  BindText(st.get(), 1, id);
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "record " + id + " not found");
  return Result::Ok();
}

std::vector<std::string> SqliteRepository::ListRecordIds(Transaction& t, const RecordQuery& query) {
  auto* db    = TX(t).Handle();
  auto  where = BuildWhere(query);

  auto st = Prepare(db, "SELECT id FROM records" + where.sql + " ORDER BY id" + LimitClause(query) + ";");
  BindParams(st.get(), where.params);

  std::vector<std::string> ids;
  int                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    ids.push_back(ColText(st.get(), 0));
  }
  ThrowIfError(Translate(db, rc), "list records");
  return ids;
}

std::vector<model::Record> SqliteRepository::ListRecords(Transaction& t, const RecordQuery& query) {
  std::vector<model::Record> out;
  for (const auto& id : ListRecordIds(t, query)) {
    if (auto record = GetRecord(t, id)) out.push_back(std::move(*record));
  }
  return out;
}

uint64_t SqliteRepository::CountRecords(Transaction& t, const RecordQuery& query) {
  auto* db    = TX(t).Handle();
  auto  where = BuildWhere(query);

  auto st = Prepare(db, "SELECT COUNT(*) FROM records" + where.sql + ";");
  BindParams(st.get(), where.params);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIfError(Translate(db, rc), "count records");
    return 0;
  }
  return ColU64(st.get(), 0);
}

std::vector<std::string> SqliteRepository::ListEntities(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT DISTINCT entity FROM records ORDER BY entity;");

  std::vector<std::string> entities;
  int                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    entities.push_back(ColText(st.get(), 0));
  }
  ThrowIfError(Translate(db, rc), "list entities");
  return entities;
}

BatchResult SqliteRepository::StageBatchIds(sqlite3* db, const RecordQuery& query) {
  auto& sqlite_db = *db_;
  sqlite_db.Exec("CREATE TEMP TABLE IF NOT EXISTS batch_ids (id TEXT PRIMARY KEY, project_id TEXT NOT NULL);");
  sqlite_db.Exec("DELETE FROM temp.batch_ids;");

  auto where = BuildWhere(query);
  auto stage = Prepare(db, "INSERT INTO temp.batch_ids(id, project_id) SELECT id, project_id FROM records" + where.sql + " ORDER BY id" +
                               LimitClause(query) + ";");
  BindParams(stage.get(), where.params);
  int rc = sqlite3_step(stage.get());
  if (rc != SQLITE_DONE) ThrowIfError(Translate(db, rc), "stage batch ids");

  BatchResult result;
  auto        list = Prepare(db, "SELECT id, project_id FROM temp.batch_ids ORDER BY id;");
  while ((rc = sqlite3_step(list.get())) == SQLITE_ROW) {
    result.ids.push_back(ColText(list.get(), 0));
    auto project_id = ColText(list.get(), 1);
    if (!project_id.empty()) ++result.changes_by_project[project_id];
  }
  ThrowIfError(Translate(db, rc), "list batch ids");
  return result;
}

BatchResult SqliteRepository::BatchUpdate(Transaction& t, const RecordQuery& query, const model::FieldMap& assignments, uint64_t now_ms) {
  auto* db     = TX(t).Handle();
  auto  result = StageBatchIds(db, query);
  if (result.ids.empty()) return result;

  auto bump = Prepare(db, "UPDATE records SET revision=revision+1, updated_at_ms=? WHERE id IN (SELECT id FROM temp.batch_ids);");
  BindU64(bump.get(), 1, now_ms);
  int rc = sqlite3_step(bump.get());
  if (rc != SQLITE_DONE) ThrowIfError(Translate(db, rc), "batch update revisions");

  for (const auto& [name, value] : assignments) {
    if (std::holds_alternative<std::monostate>(value)) {
      auto clear = Prepare(db, "DELETE FROM record_fields WHERE name=? AND record_id IN (SELECT id FROM temp.batch_ids);");
      BindText(clear.get(), 1, name);
      rc = sqlite3_step(clear.get());
      if (rc != SQLITE_DONE) ThrowIfError(Translate(db, rc), "batch clear field");
      continue;
    }

    auto encoded = Encode(value);
    auto upsert  = Prepare(db,
                          "INSERT INTO record_fields(record_id,name,kind,int_value,real_value,text_value) "
                           "SELECT id,?,?,?,?,? FROM temp.batch_ids WHERE 1 "
                           "ON CONFLICT(record_id,name) DO UPDATE SET kind=excluded.kind,int_value=excluded.int_value,"
                           "real_value=excluded.real_value,text_value=excluded.text_value;");
    BindText(upsert.get(), 1, name);
    BindI32(upsert.get(), 2, encoded.kind);
    BindParams(upsert.get(), {encoded.int_value, encoded.real_value, encoded.text_value}, 3);
    rc = sqlite3_step(upsert.get());
    if (rc != SQLITE_DONE) ThrowIfError(Translate(db, rc), "batch set field");
  }
  return result;
}

BatchResult SqliteRepository::BatchDelete(Transaction& t, const RecordQuery& query) {
  auto* db     = TX(t).Handle();
  auto  result = StageBatchIds(db, query);
  if (result.ids.empty()) return result;

  auto st = Prepare(db, "DELETE FROM records WHERE id IN (SELECT id FROM temp.batch_ids);");
  int  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowIfError(Translate(db, rc), "batch delete");
  return result;
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result SqliteRepository::InsertVersion(Transaction& t, const model::VersionRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO versions(") + kVersionColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.project_id);
  BindU64(st.get(), 3, r.version_number);
  BindI32(st.get(), 4, static_cast<int>(r.type));
  BindText(st.get(), 5, r.comment);
  BindText(st.get(), 6, r.author);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.data_size);
  sqlite3_bind_blob(st.get(), 9, r.payload.data(), static_cast<int>(r.payload.size()), SQLITE_TRANSIENT);
  BindText(st.get(), 10, r.checksum);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "version " + std::to_string(r.version_number) + " exists for project " + r.project_id);
  }
  if (rc != SQLITE_DONE) return Translate(db, rc);

  auto counter = Prepare(db,
                         "INSERT INTO version_counters(project_id,last_number) VALUES(?,?) "
                         "ON CONFLICT(project_id) DO UPDATE SET last_number=max(last_number, excluded.last_number);");
  BindText(counter.get(), 1, r.project_id);
  BindU64(counter.get(), 2, r.version_number);
  return Translate(db, sqlite3_step(counter.get()));
}

std::vector<model::VersionRecord> SqliteRepository::QueryVersions(sqlite3* db, const std::string& sql, const std::string& bind) {
  auto st = Prepare(db, sql);
  if (!bind.empty()) BindText(st.get(), 1, bind);

  std::vector<model::VersionRecord> out;
  int                               rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadVersion(st.get()));
  }
  ThrowIfError(Translate(db, rc), "list versions");
  return out;
}

std::optional<model::VersionRecord> SqliteRepository::GetVersion(Transaction& t, const std::string& id) {
  auto rows = QueryVersions(TX(t).Handle(), std::string("SELECT ") + kVersionColumns + " FROM versions WHERE id=?;", id);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::optional<model::VersionRecord> SqliteRepository::GetVersionByNumber(Transaction& t, const std::string& project_id, uint64_t number) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kVersionColumns + " FROM versions WHERE project_id=? AND version_number=?;");
  BindText(st.get(), 1, project_id);
  BindU64(st.get(), 2, number);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ReadVersion(st.get());
  ThrowIfError(Translate(db, rc), "read version");
  return std::nullopt;
}

std::vector<model::VersionRecord> SqliteRepository::ListVersions(Transaction& t, const std::string& project_id) {
  return QueryVersions(TX(t).Handle(),
                       std::string("SELECT ") + kVersionColumns + " FROM versions WHERE project_id=? ORDER BY version_number;",
                       project_id);
}

std::vector<model::VersionRecord> SqliteRepository::ListAllVersions(Transaction& t) {
  return QueryVersions(TX(t).Handle(), std::string("SELECT ") + kVersionColumns + " FROM versions ORDER BY project_id, version_number;", {});
}

uint64_t SqliteRepository::LastVersionNumber(Transaction& t, const std::string& project_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                    "SELECT max(coalesce((SELECT last_number FROM version_counters WHERE project_id=?1),0),"
                     "coalesce((SELECT max(version_number) FROM versions WHERE project_id=?1),0));");
  BindText(st.get(), 1, project_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    ThrowIfError(Translate(db, rc), "read version counter");
    return 0;
  }
  return ColU64(st.get(), 0);
}

Result SqliteRepository::UpdateVersionChecksum(Transaction& t, const std::string& id, const std::string& checksum) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE versions SET checksum=? WHERE id=?;");
  BindText(st.get(), 1, checksum);
  BindText(st.get(), 2, id);
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "version " + id + " not found");
  return Result::Ok();
}

Result SqliteRepository::DeleteVersion(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM versions WHERE id=?;");
  BindText(st.get(), 1, id);
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "version " + id + " not found");
  return Result::Ok();
}

Result SqliteRepository::DeleteVersionsForProject(Transaction& t, const std::string& project_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM versions WHERE project_id=?;");
  BindText(st.get(), 1, project_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Repair audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertRepairRecord(Transaction& t, const model::RepairRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO repair_history(id,performed_at_ms,attempted,repaired,failed,duration_ms,type) VALUES(?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.performed_at_ms);
  BindU64(st.get(), 3, r.attempted);
  BindU64(st.get(), 4, r.repaired);
  BindU64(st.get(), 5, r.failed);
  BindU64(st.get(), 6, r.duration_ms);
  BindI32(st.get(), 7, static_cast<int>(r.type));
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::RepairRecord> SqliteRepository::ListRepairRecords(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT id,performed_at_ms,attempted,repaired,failed,duration_ms,type FROM repair_history ORDER BY performed_at_ms, id;");

  std::vector<model::RepairRecord> out;
  int                              rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::RepairRecord r;
    r.id              = ColText(st.get(), 0);
    r.performed_at_ms = ColU64(st.get(), 1);
    r.attempted       = static_cast<uint32_t>(ColU64(st.get(), 2));
    r.repaired        = static_cast<uint32_t>(ColU64(st.get(), 3));
    r.failed          = static_cast<uint32_t>(ColU64(st.get(), 4));
    r.duration_ms     = ColU64(st.get(), 5);
    r.type            = static_cast<archstore::v1::RepairType>(ColI32(st.get(), 6));
    out.push_back(r);
  }
  ThrowIfError(Translate(db, rc), "list repair history");
  return out;
}

} // namespace archstore::db::sqlite
