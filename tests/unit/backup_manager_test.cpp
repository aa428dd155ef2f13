#include "internal/backup/backup_manager.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using archstore::backup::BackupManager;
using archstore::backup::BackupOptions;

fs::path Scratch(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "archstore_backup_manager_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteFile(const fs::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream     in(path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void TestBackupCopiesStoreTriplet() {
  const auto dir   = Scratch("triplet");
  const auto store = dir / "home.sqlite";
  WriteFile(store, "main-pages");
  WriteFile(dir / "home.sqlite-wal", "wal-frames");

  BackupManager manager({dir / "backups"});
  const auto    record = manager.CreateBackup(store, archstore::v1::BACKUP_TYPE_MANUAL, "2.0");

  assert(fs::exists(record.backup_path()));
  assert(ReadFile(record.backup_path()) == "main-pages");
  assert(record.journal_files_size() == 1);
  assert(ReadFile(record.journal_files(0)) == "wal-frames");
  assert(record.size_bytes() == 10);
  assert(record.schema_version() == "2.0");

  const auto name = fs::path(record.backup_path()).filename().string();
  assert(name.rfind("backup_", 0) == 0);
  assert(name.find(record.id()) != std::string::npos);
  assert(fs::path(name).extension() == ".sqlite");
  assert(fs::exists(manager.IndexPath()));

  const auto found = manager.FindBackup(record.id());
  assert(found.has_value());
  assert(found->type() == archstore::v1::BACKUP_TYPE_MANUAL);
  assert(found->source_path() == store.string());
}

void TestRestoreReplacesStoreFiles() {
  const auto dir   = Scratch("restore");
  const auto store = dir / "home.sqlite";
  WriteFile(store, "before");

  BackupManager manager({dir / "backups"});
  const auto    record = manager.CreateBackup(store, archstore::v1::BACKUP_TYPE_PRE_MIGRATION);

  WriteFile(store, "after a bad migration");
  WriteFile(dir / "home.sqlite-wal", "stale frames");
  WriteFile(dir / "home.sqlite-shm", "stale index");

  manager.RestoreBackup(record, store);
  assert(ReadFile(store) == "before");
  // the backup had no journal, so stale journal files must not survive
  assert(!fs::exists(dir / "home.sqlite-wal"));
  assert(!fs::exists(dir / "home.sqlite-shm"));
}

void TestTamperedBackupIsNotRestored() {
  const auto dir   = Scratch("tampered");
  const auto store = dir / "home.sqlite";
  WriteFile(store, "good pages");

  BackupManager manager({dir / "backups"});
  const auto    record = manager.CreateBackup(store, archstore::v1::BACKUP_TYPE_MANUAL);
  assert(record.sha256().size() == 64);

  WriteFile(record.backup_path(), "bad pages");
  WriteFile(store, "current pages");

  bool threw = false;
  try {
    manager.RestoreBackup(record, store);
  } catch (const archstore::util::CorruptionError&) {
    threw = true;
  }
  assert(threw);
  assert(ReadFile(store) == "current pages");
}

void TestListIsNewestFirst() {
  const auto dir   = Scratch("list");
  const auto store = dir / "home.sqlite";
  WriteFile(store, "data");

  auto          now = std::make_shared<archstore::util::TimePoint>(archstore::util::Now());
  BackupOptions options{dir / "backups"};
  options.clock = [now] { return *now; };
  BackupManager manager(options);

  const auto older = manager.CreateBackup(store, archstore::v1::BACKUP_TYPE_AUTOMATIC);
  *now += std::chrono::seconds(5);
  const auto newer = manager.CreateBackup(store, archstore::v1::BACKUP_TYPE_MANUAL);

  const auto listed = manager.ListBackups();
  assert(listed.size() == 2);
  assert(listed[0].id() == newer.id());
  assert(listed[1].id() == older.id());
}

void TestCleanupExpiredRemovesOnlyOldBackups() {
  const auto dir   = Scratch("expiry");
  const auto store = dir / "home.sqlite";
  WriteFile(store, "data");

  auto          now = std::make_shared<archstore::util::TimePoint>(archstore::util::Now());
  BackupOptions options{dir / "backups"};
  options.retention = std::chrono::hours(24);
  options.clock     = [now] { return *now; };
  BackupManager manager(options);

  const auto old_backup = manager.CreateBackup(store, archstore::v1::BACKUP_TYPE_AUTOMATIC);
  *now += std::chrono::hours(20);
  const auto recent = manager.CreateBackup(store, archstore::v1::BACKUP_TYPE_AUTOMATIC);

  assert(manager.CleanupExpired() == 0);

  *now += std::chrono::hours(5);
  assert(manager.CleanupExpired() == 1);
  assert(!fs::exists(old_backup.backup_path()));
  assert(!manager.FindBackup(old_backup.id()).has_value());
  assert(fs::exists(recent.backup_path()));
  assert(manager.ListBackups().size() == 1);
}

void TestDeleteBackup() {
  const auto dir   = Scratch("delete");
  const auto store = dir / "home.sqlite";
  WriteFile(store, "data");
  WriteFile(dir / "home.sqlite-wal", "wal");

  BackupManager manager({dir / "backups"});
  const auto    record = manager.CreateBackup(store, archstore::v1::BACKUP_TYPE_MANUAL);

  manager.DeleteBackup(record.id());
  assert(!fs::exists(record.backup_path()));
  assert(!fs::exists(record.journal_files(0)));
  assert(manager.ListBackups().empty());

  bool threw = false;
  try {
    manager.DeleteBackup(record.id());
  } catch (const archstore::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFilesAreReported() {
  const auto dir = Scratch("missing");

  BackupManager manager({dir / "backups"});

  bool threw = false;
  try {
    manager.CreateBackup(dir / "absent.sqlite", archstore::v1::BACKUP_TYPE_MANUAL);
  } catch (const archstore::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  archstore::v1::BackupRecord ghost;
  ghost.set_id("ghost");
  ghost.set_backup_path((dir / "backups" / "ghost.sqlite").string());

  threw = false;
  try {
    manager.RestoreBackup(ghost, dir / "home.sqlite");
  } catch (const archstore::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCleanupTemporaryFiles() {
  const auto dir   = Scratch("temporary");
  const auto store = dir / "home.sqlite";
  WriteFile(store, "data");
  WriteFile(dir / "home.sqlite.migrated_1.1", "step");
  WriteFile(dir / "home.sqlite.migrated_2.0-wal", "step");
  WriteFile(dir / "home.sqlite.migration_temp", "temp");
  WriteFile(dir / "other.sqlite.migrated_1.1", "unrelated");

  BackupManager manager({dir / "backups"});
  assert(manager.CleanupTemporaryFiles(store) == 3);
  assert(fs::exists(store));
  assert(fs::exists(dir / "other.sqlite.migrated_1.1"));
  assert(manager.CleanupTemporaryFiles(store) == 0);
}

} // namespace

int main() {
  TestBackupCopiesStoreTriplet();
  TestRestoreReplacesStoreFiles();
  TestTamperedBackupIsNotRestored();
  TestListIsNewestFirst();
  TestCleanupExpiredRemovesOnlyOldBackups();
  TestDeleteBackup();
  TestMissingFilesAreReported();
  TestCleanupTemporaryFiles();

  std::cout << "archstore_unit_backup_manager: pass\n";
  return 0;
}
