#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "archstore/v1/backup.pb.h"
#include "internal/util/time.hpp"

namespace archstore::backup {

struct BackupOptions {
  std::filesystem::path     directory;
  std::chrono::hours        retention{24 * 30};
  uint32_t                  max_copy_attempts = 3;
  std::chrono::milliseconds retry_backoff{50};
  util::ClockFn             clock = util::Now;
};

/*
  Full-store copies used as safety nets.

  A store is the triplet <file>, <file>-wal, <file>-shm and is always copied,
  restored and removed as one unit. Backups are named
  backup_<yyyy-MM-dd_HH-mm-ss>_<id>.sqlite and indexed in
  backup_metadata.json next to them.

  Only file copies are retried; everything else fails on first error.
*/
class BackupManager {
 public:
  explicit BackupManager(BackupOptions options);

  archstore::v1::BackupRecord CreateBackup(const std::filesystem::path& store_path, archstore::v1::BackupType type,
                                           const std::string& schema_version = {});

  // Replaces the store triplet with the backup triplet. The store must not
  // be open.
  void RestoreBackup(const archstore::v1::BackupRecord& record, const std::filesystem::path& store_path);

  // Newest first.
  std::vector<archstore::v1::BackupRecord>   ListBackups() const;
  std::optional<archstore::v1::BackupRecord> FindBackup(const std::string& id) const;

  void DeleteBackup(const std::string& id);

  // Removes backups past their expiry. Returns the number removed.
  uint32_t CleanupExpired();

  // Removes <store>.migrated_* and <store>.migration_temp leftovers.
  uint32_t CleanupTemporaryFiles(const std::filesystem::path& store_path);

  const std::filesystem::path& Directory() const {
    return options_.directory;
  }

  std::filesystem::path IndexPath() const;

 private:
  void                       CopyWithRetry(const std::filesystem::path& from, const std::filesystem::path& to) const;
  archstore::v1::BackupIndex LoadIndexLocked() const;
  void                       SaveIndexLocked(const archstore::v1::BackupIndex& index) const;
  static void                RemoveTriplet(const std::filesystem::path& main);

  BackupOptions      options_;
  mutable std::mutex mutex_;
};

// Journal suffixes of a SQLite store in WAL mode.
inline constexpr const char* kJournalSuffixes[] = {"-wal", "-shm"};

} // namespace archstore::backup
