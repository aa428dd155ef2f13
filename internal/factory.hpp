#pragma once

#include <memory>
#include <optional>
#include <string>

#include "archstore/v1/migration.pb.h"
#include "config/config.pb.h"
#include "internal/backup/backup_manager.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/history/autosave_worker.hpp"
#include "internal/history/change_tracker.hpp"
#include "internal/history/version_manager.hpp"
#include "internal/integrity/integrity_checker.hpp"
#include "internal/integrity/integrity_monitor.hpp"
#include "internal/migration/migration_engine.hpp"
#include "internal/migration/migration_registry.hpp"
#include "internal/model/schema.hpp"
#include "internal/storage/storage_engine.hpp"
#include "internal/util/errors.hpp"

namespace archstore::factory {

/*
  StoreRuntime

  Owns every long-lived service of one opened store.
  Everything here lives until Shutdown().
*/
struct StoreRuntime {
  archstore::runtime::config::RuntimeConfig config;

  std::shared_ptr<const model::SchemaCatalog>         catalog;
  std::shared_ptr<const migration::MigrationRegistry> registry;
  std::shared_ptr<events::EventBus>                   bus;

  std::shared_ptr<backup::BackupManager>       backups;
  std::shared_ptr<migration::MigrationEngine>  migrations;
  std::shared_ptr<storage::StorageEngine>      engine;
  std::shared_ptr<history::VersionManager>     versions;
  std::shared_ptr<history::ChangeTracker>      changes;
  std::shared_ptr<history::AutoSaveWorker>     autosave;
  std::shared_ptr<integrity::IntegrityChecker> integrity;
  std::shared_ptr<integrity::IntegrityMonitor> monitor;

  // Set when opening the store ran a migration.
  std::optional<archstore::v1::MigrationHistoryEntry> migration;

  void StartWorkers();

  // Stops workers, commits pending view changes and closes the engine.
  void Shutdown();
};

/*
  BuildRuntime

  Composition root. Migrates the store when its schema is older than the
  current one (taking beforeMigration snapshots first when configured),
  then opens the engine and wires the services. Workers are not started.
*/
StoreRuntime BuildRuntime(const archstore::runtime::config::RuntimeConfig& config);

struct BuildResult {
  std::optional<StoreRuntime>     runtime;
  std::optional<util::ErrorClass> error_class;
  std::string                     error;

  bool ok() const {
    return runtime.has_value();
  }
};

// Startup failures as a value instead of an exception.
BuildResult TryBuildRuntime(const archstore::runtime::config::RuntimeConfig& config);

// Services that only need the store file, not an open engine.
std::shared_ptr<backup::BackupManager>      BuildBackupManager(const archstore::runtime::config::RuntimeConfig& config);
std::shared_ptr<migration::MigrationEngine> BuildMigrationEngine(const archstore::runtime::config::RuntimeConfig& config,
                                                                 std::shared_ptr<backup::BackupManager> backups, std::shared_ptr<events::EventBus> bus);

} // namespace archstore::factory
