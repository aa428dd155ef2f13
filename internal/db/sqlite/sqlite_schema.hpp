#pragma once

#include <optional>
#include <string>

#include "sqlite_db.hpp"

namespace archstore::db::sqlite {

inline constexpr const char* kSchemaVersionKey = "schema_version";

/*
  Creates the store layout if missing and tags a fresh store with
  schema_version. An existing tag is never overwritten here.
*/
void BootstrapStore(SqliteDB& db, const std::string& schema_version);

// Overwrites the schema_version tag (used by migration steps).
void WriteSchemaVersion(SqliteDB& db, const std::string& schema_version);

// Reads the tag without creating anything. nullopt when the table or key
// is absent.
std::optional<std::string> ReadSchemaVersion(SqliteDB& db);

} // namespace archstore::db::sqlite
