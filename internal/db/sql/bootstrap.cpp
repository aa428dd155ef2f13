#include "bootstrap.hpp"

namespace archstore::db::sql {

void RunBootstrap(DdlExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& StoreLayoutDdl() {
  static const std::vector<std::string> kDdl = {
      "CREATE TABLE IF NOT EXISTS store_metadata (key TEXT PRIMARY KEY, value TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS records (id TEXT PRIMARY KEY, entity TEXT NOT NULL, project_id TEXT NOT NULL DEFAULT '', revision INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS records_entity_idx ON records(entity, id);",
      "CREATE INDEX IF NOT EXISTS records_project_idx ON records(project_id);",
      "CREATE TABLE IF NOT EXISTS record_fields (record_id TEXT NOT NULL REFERENCES records(id) ON DELETE CASCADE, name TEXT NOT NULL, kind INTEGER NOT NULL, int_value INTEGER, real_value REAL, text_value TEXT, PRIMARY KEY (record_id, name));",
      "CREATE TABLE IF NOT EXISTS record_relationships (source_id TEXT NOT NULL REFERENCES records(id) ON DELETE CASCADE, position INTEGER NOT NULL, name TEXT NOT NULL, target_id TEXT NOT NULL, owning INTEGER NOT NULL, PRIMARY KEY (source_id, position));",
      "CREATE INDEX IF NOT EXISTS record_relationships_target_idx ON record_relationships(target_id);",
      "CREATE TABLE IF NOT EXISTS versions (id TEXT PRIMARY KEY, project_id TEXT NOT NULL, version_number INTEGER NOT NULL, type INTEGER NOT NULL, comment TEXT NOT NULL DEFAULT '', author TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, data_size INTEGER NOT NULL, payload BLOB NOT NULL, checksum TEXT NOT NULL, UNIQUE(project_id, version_number));",
      "CREATE TABLE IF NOT EXISTS version_counters (project_id TEXT PRIMARY KEY, last_number INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS repair_history (id TEXT PRIMARY KEY, performed_at_ms INTEGER NOT NULL, attempted INTEGER NOT NULL, repaired INTEGER NOT NULL, failed INTEGER NOT NULL, duration_ms INTEGER NOT NULL, type INTEGER NOT NULL);"};
  return kDdl;
}

const std::vector<std::string>& StoreLayoutChecks() {
  static const std::vector<std::string> kChecks = {
      "SELECT key,value FROM store_metadata LIMIT 1;",
      "SELECT id,entity,project_id,revision,created_at_ms,updated_at_ms FROM records LIMIT 1;",
      "SELECT record_id,name,kind,int_value,real_value,text_value FROM record_fields LIMIT 1;",
      "SELECT source_id,position,name,target_id,owning FROM record_relationships LIMIT 1;",
      "SELECT id,project_id,version_number,type,comment,author,created_at_ms,data_size,payload,checksum FROM versions LIMIT 1;",
      "SELECT project_id,last_number FROM version_counters LIMIT 1;",
      "SELECT id,performed_at_ms,attempted,repaired,failed,duration_ms,type FROM repair_history LIMIT 1;"};
  return kChecks;
}

} // namespace archstore::db::sql
