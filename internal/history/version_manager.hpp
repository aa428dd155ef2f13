#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "archstore/v1/snapshot.pb.h"
#include "internal/db/model/version_record.hpp"
#include "internal/migration/migration_registry.hpp"
#include "internal/model/schema.hpp"
#include "internal/storage/storage_engine.hpp"

namespace archstore::history {

struct VersionOptions {
  uint32_t                  max_versions = 50;
  std::chrono::milliseconds min_auto_interval{std::chrono::seconds(60)};
  std::string               author = "local";
  std::string               app_version;
};

struct VersionStatistics {
  uint64_t                       total       = 0;
  uint64_t                       automatic   = 0;
  uint64_t                       manual      = 0;
  uint64_t                       total_bytes = 0;
  std::optional<util::TimePoint> oldest;
  std::optional<util::TimePoint> newest;
};

archstore::v1::VersionInfo ToVersionInfo(const db::model::VersionRecord& record);
const char*                VersionTypeName(archstore::v1::VersionType type);

/*
  Checksummed project snapshots.

  Version numbers are assigned inside StorageEngine::RunSerialized so
  racing creators get strictly increasing numbers. Snapshots capture the
  durable state; pending context changes are not included.

  Retention only ever prunes non-manual versions, oldest first.
*/
class VersionManager {
 public:
  VersionManager(std::shared_ptr<storage::StorageEngine> engine, std::shared_ptr<const model::SchemaCatalog> catalog,
                 std::shared_ptr<const migration::MigrationRegistry> registry, VersionOptions options = {});

  // Automatic versions closer than min_auto_interval to the previous
  // automatic one fail with TooFrequent.
  archstore::v1::VersionInfo CreateVersion(const std::string& project_id, archstore::v1::VersionType type, const std::string& comment = {});

  // Commits the view context, then creates a manual version.
  archstore::v1::VersionInfo SaveManually(const std::string& project_id, const std::string& comment);

  // Returns the beforeRestore version taken of the state being replaced.
  // Throws CorruptionError when the stored payload fails its checksum.
  archstore::v1::VersionInfo RestoreVersion(const archstore::v1::VersionInfo& snapshot, const std::string& project_id);

  // Manual versions cannot be deleted.
  void DeleteVersion(const archstore::v1::VersionInfo& snapshot);

  std::vector<archstore::v1::VersionInfo>   ListVersions(const std::string& project_id) const;
  std::optional<archstore::v1::VersionInfo> GetVersion(const std::string& id) const;
  std::optional<archstore::v1::VersionInfo> GetVersionByNumber(const std::string& project_id, uint64_t number) const;

  bool VerifyVersion(const archstore::v1::VersionInfo& snapshot) const;

  VersionStatistics Statistics(const std::string& project_id) const;

  const VersionOptions& Options() const {
    return options_;
  }

 private:
  db::model::VersionRecord LoadRecord(const std::string& id) const;
  void                     ApplyRetention(db::Repository& repo, db::Transaction& tx, const std::string& project_id,
                                          std::vector<db::model::VersionRecord>& pruned) const;
  void                     Publish(events::VersionEvent::Action action, const db::model::VersionRecord& record) const;

  std::shared_ptr<storage::StorageEngine>             engine_;
  std::shared_ptr<const model::SchemaCatalog>         catalog_;
  std::shared_ptr<const migration::MigrationRegistry> registry_;
  VersionOptions                                      options_;
};

} // namespace archstore::history
