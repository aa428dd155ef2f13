#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/record_query.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/record.hpp"
#include "internal/db/model/repair_record.hpp"
#include "internal/db/model/version_record.hpp"

namespace archstore::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Record revision increments are atomic with the write
  - One transaction at a time per repository; Begin blocks until the
    previous transaction ends

  The DB is the source of truth for:
    records, fields and relationships
    version snapshots
    schema version tag
    repair audit trail
*/

// Outcome of a set-based change.
struct BatchResult {
  std::vector<std::string> ids;

  // project id -> affected rows; catalog rows are not counted
  std::map<std::string, uint64_t> changes_by_project;
};

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Store metadata (schema_version, ...)
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetStoreValue(Transaction&, const std::string& key) = 0;

  virtual Result SetStoreValue(Transaction&, const std::string& key, const std::string& value) = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  virtual Result InsertRecord(Transaction&, const model::Record&) = 0;

  virtual std::optional<model::Record> GetRecord(Transaction&, const std::string& id) = 0;

  // Replaces row, fields and relationships. Caller sets revision.
  virtual Result UpdateRecord(Transaction&, const model::Record&) = 0;

  virtual Result DeleteRecord(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::Record> ListRecords(Transaction&, const RecordQuery&) = 0;

  virtual std::vector<std::string> ListRecordIds(Transaction&, const RecordQuery&) = 0;

  virtual uint64_t CountRecords(Transaction&, const RecordQuery&) = 0;

  // Distinct entity names present in the table.
  virtual std::vector<std::string> ListEntities(Transaction&) = 0;

  // Set-based; returns affected ids grouped by owning project.
  virtual BatchResult BatchUpdate(Transaction&, const RecordQuery&, const model::FieldMap& assignments, uint64_t now_ms) = 0;

  virtual BatchResult BatchDelete(Transaction&, const RecordQuery&) = 0;

  // ---------------------------------------------------------------------
  // Versions
  // ---------------------------------------------------------------------

  virtual Result InsertVersion(Transaction&, const model::VersionRecord&) = 0;

  virtual std::optional<model::VersionRecord> GetVersion(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::VersionRecord> GetVersionByNumber(Transaction&, const std::string& project_id, uint64_t number) = 0;

  // Ordered by version_number ascending.
  virtual std::vector<model::VersionRecord> ListVersions(Transaction&, const std::string& project_id) = 0;

  virtual std::vector<model::VersionRecord> ListAllVersions(Transaction&) = 0;

  // Highest number ever assigned for the project, including deleted ones.
  virtual uint64_t LastVersionNumber(Transaction&, const std::string& project_id) = 0;

  virtual Result UpdateVersionChecksum(Transaction&, const std::string& id, const std::string& checksum) = 0;

  virtual Result DeleteVersion(Transaction&, const std::string& id) = 0;

  virtual Result DeleteVersionsForProject(Transaction&, const std::string& project_id) = 0;

  // ---------------------------------------------------------------------
  // Repair audit
  // ---------------------------------------------------------------------

  virtual Result InsertRepairRecord(Transaction&, const model::RepairRecord&) = 0;

  virtual std::vector<model::RepairRecord> ListRepairRecords(Transaction&) = 0;
};

} // namespace archstore::db
