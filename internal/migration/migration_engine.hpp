#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "archstore/v1/migration.pb.h"
#include "internal/backup/backup_manager.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/migration/migration_registry.hpp"
#include "internal/model/schema.hpp"
#include "internal/util/time.hpp"

namespace archstore::migration {

enum class MigrationState {
  kNotRequired,
  kRequired,
  kPreparing,
  kBackingUp,
  kMigrating,
  kValidating,
  kCompleted,
  kRollbackRequired,
  kRollingBack,
  kRollbackCompleted,
  kFailed,
};

const char* MigrationStateName(MigrationState state);

struct MigrationOptions {
  std::chrono::milliseconds timeout{std::chrono::minutes(5)};
  std::filesystem::path     history_path;  // migration_history.json; empty disables
  std::size_t               batch_size = 500;
  util::ClockFn             clock      = util::Now;
  util::SteadyFn            ticker     = util::SteadyNow;
};

/*
  Brings a store file up to the current schema version.

  Migrate() never works on an open store. It backs the triplet up, writes
  each step into <store>.migrated_<version>, swaps the final file into
  place through <store>.migration_temp and re-opens it for validation. Any
  failure after the backup restores the backup and ends in kFailed; steps
  are never retried.
*/
class MigrationEngine {
 public:
  using ProgressCallback = std::function<void(double progress, MigrationState state)>;

  MigrationEngine(std::shared_ptr<const model::SchemaCatalog> catalog, std::shared_ptr<const MigrationRegistry> registry,
                  std::shared_ptr<backup::BackupManager> backups, std::shared_ptr<events::EventBus> bus, MigrationOptions options = {});

  // Stored schema version. nullopt when the file does not exist; "1.0"
  // for stores that predate version tagging.
  std::optional<std::string> StoredVersion(const std::filesystem::path& store_path) const;

  // Sets kRequired or kNotRequired.
  bool CheckForRequiredMigration(const std::filesystem::path& store_path);

  MigrationPlan PlanMigration(const std::string& from, const std::string& to) const;

  archstore::v1::StoreDiagnostics Diagnostics(const std::filesystem::path& store_path) const;

  // Throws MigrationPathNotFound before touching the store, MigrationFailed
  // (or OperationCancelled / OperationTimedOut) after a successful rollback
  // and RollbackFailure when the backup could not be restored.
  archstore::v1::MigrationHistoryEntry Migrate(const std::filesystem::path& store_path);

  // Honoured between steps and record batches.
  void Cancel();

  MigrationState              State() const;
  std::vector<MigrationState> StateHistory() const;
  double                      Progress() const {
    return progress_.load();
  }

  void SetProgressCallback(ProgressCallback callback);

  archstore::v1::MigrationHistory History() const;

 private:
  void                  Transition(MigrationState state);
  void                  SetProgress(double progress);
  void                  CheckInterrupted(std::chrono::steady_clock::time_point deadline) const;
  std::filesystem::path RunStep(const MigrationStep& step, const std::filesystem::path& source, const std::filesystem::path& store_path,
                                std::chrono::steady_clock::time_point deadline);
  void                  Swap(const std::filesystem::path& migrated, const std::filesystem::path& store_path);
  void                  Validate(const std::filesystem::path& store_path, const std::string& expected_version);
  void                  Rollback(const archstore::v1::BackupRecord& backup, const std::filesystem::path& store_path);
  void                  AppendHistory(const archstore::v1::MigrationHistoryEntry& entry);

  std::shared_ptr<const model::SchemaCatalog> catalog_;
  std::shared_ptr<const MigrationRegistry>    registry_;
  std::shared_ptr<backup::BackupManager>      backups_;
  std::shared_ptr<events::EventBus>           bus_;
  MigrationOptions                            options_;

  mutable std::mutex          state_mutex_;
  MigrationState              state_ = MigrationState::kNotRequired;
  std::vector<MigrationState> history_;
  std::string                 from_version_;
  std::string                 to_version_;
  ProgressCallback            progress_callback_;

  std::atomic<double> progress_{0.0};
  std::atomic<bool>   cancel_requested_{false};

  mutable std::mutex history_file_mutex_;
};

} // namespace archstore::migration
