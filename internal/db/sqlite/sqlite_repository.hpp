#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace archstore::db::sqlite {

/*
  SQLite implementation of db::Repository.

  Records are spread over three tables (records, record_fields,
  record_relationships); fields and relationships cascade on delete.
*/
class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  std::optional<std::string> GetStoreValue(Transaction&, const std::string& key) override;
  Result                     SetStoreValue(Transaction&, const std::string& key, const std::string& value) override;

  Result                       InsertRecord(Transaction&, const model::Record&) override;
  std::optional<model::Record> GetRecord(Transaction&, const std::string& id) override;
  Result                       UpdateRecord(Transaction&, const model::Record&) override;
  Result                       DeleteRecord(Transaction&, const std::string& id) override;
  std::vector<model::Record>   ListRecords(Transaction&, const RecordQuery&) override;
  std::vector<std::string>     ListRecordIds(Transaction&, const RecordQuery&) override;
  uint64_t                     CountRecords(Transaction&, const RecordQuery&) override;
  std::vector<std::string>     ListEntities(Transaction&) override;
  BatchResult BatchUpdate(Transaction&, const RecordQuery&, const model::FieldMap& assignments, uint64_t now_ms) override;
  BatchResult BatchDelete(Transaction&, const RecordQuery&) override;

  Result                              InsertVersion(Transaction&, const model::VersionRecord&) override;
  std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string& id) override;
  std::optional<model::VersionRecord> GetVersionByNumber(Transaction&, const std::string& project_id, uint64_t number) override;
  std::vector<model::VersionRecord>   ListVersions(Transaction&, const std::string& project_id) override;
  std::vector<model::VersionRecord>   ListAllVersions(Transaction&) override;
  uint64_t                            LastVersionNumber(Transaction&, const std::string& project_id) override;
  Result UpdateVersionChecksum(Transaction&, const std::string& id, const std::string& checksum) override;
  Result DeleteVersion(Transaction&, const std::string& id) override;
  Result DeleteVersionsForProject(Transaction&, const std::string& project_id) override;

  Result                           InsertRepairRecord(Transaction&, const model::RepairRecord&) override;
  std::vector<model::RepairRecord> ListRepairRecords(Transaction&) override;

  const std::shared_ptr<SqliteDB>& Database() const {
    return db_;
  }

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  Result WriteFields(sqlite3* db, const model::Record& r);
  Result WriteRelationships(sqlite3* db, const model::Record& r);
  BatchResult StageBatchIds(sqlite3* db, const RecordQuery& query);
  std::vector<model::VersionRecord> QueryVersions(sqlite3* db, const std::string& sql, const std::string& bind);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace archstore::db::sqlite
