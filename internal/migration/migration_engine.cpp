#include "migration_engine.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace archstore::migration {

namespace fs = std::filesystem;

using archstore::v1::BackupRecord;
using archstore::v1::MigrationHistory;
using archstore::v1::MigrationHistoryEntry;
using db::sqlite::SqliteDB;
using db::sqlite::SqliteRepository;

namespace {

constexpr const char* kJournalSuffixes[] = {"-wal", "-shm"};

fs::path WithSuffix(const fs::path& path, const std::string& suffix) {
  return fs::path(path.string() + suffix);
}

void RemoveTriplet(const fs::path& main) {
  std::error_code ec;
  fs::remove(main, ec);
  if (ec) throw util::StorageIOError("cannot remove " + main.string() + ": " + ec.message());
  for (const auto* suffix : kJournalSuffixes) {
    fs::remove(WithSuffix(main, suffix), ec);
    if (ec) throw util::StorageIOError("cannot remove " + WithSuffix(main, suffix).string() + ": " + ec.message());
  }
}

void Rename(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) throw util::StorageIOError("cannot move " + from.string() + " to " + to.string() + ": " + ec.message());
}

void MoveTriplet(const fs::path& from, const fs::path& to) {
  Rename(from, to);
  for (const auto* suffix : kJournalSuffixes) {
    if (fs::exists(WithSuffix(from, suffix))) Rename(WithSuffix(from, suffix), WithSuffix(to, suffix));
  }
}

// Folds the WAL into the main file so the file alone is the store.
void CheckpointStore(const fs::path& store_path) {
  SqliteDB db(store_path.string());
  db.Checkpoint();
}

} // namespace

const char* MigrationStateName(MigrationState state) {
  switch (state) {
    case MigrationState::kNotRequired:
      return "not_required";
    case MigrationState::kRequired:
      return "required";
    case MigrationState::kPreparing:
      return "preparing";
    case MigrationState::kBackingUp:
      return "backing_up";
    case MigrationState::kMigrating:
      return "migrating";
    case MigrationState::kValidating:
      return "validating";
    case MigrationState::kCompleted:
      return "completed";
    case MigrationState::kRollbackRequired:
      return "rollback_required";
    case MigrationState::kRollingBack:
      return "rolling_back";
    case MigrationState::kRollbackCompleted:
      return "rollback_completed";
    case MigrationState::kFailed:
      return "failed";
  }
  return "unknown";
}

MigrationEngine::MigrationEngine(std::shared_ptr<const model::SchemaCatalog> catalog, std::shared_ptr<const MigrationRegistry> registry,
                                 std::shared_ptr<backup::BackupManager> backups, std::shared_ptr<events::EventBus> bus, MigrationOptions options)
    : catalog_(std::move(catalog)), registry_(std::move(registry)), backups_(std::move(backups)), bus_(std::move(bus)), options_(std::move(options)) {
  if (!options_.clock) options_.clock = util::Now;
  if (options_.batch_size == 0) options_.batch_size = 500;
}

MigrationState MigrationEngine::State() const {
  std::lock_guard lock(state_mutex_);
  return state_;
}

std::vector<MigrationState> MigrationEngine::StateHistory() const {
  std::lock_guard lock(state_mutex_);
  return history_;
}

void MigrationEngine::SetProgressCallback(ProgressCallback callback) {
  std::lock_guard lock(state_mutex_);
  progress_callback_ = std::move(callback);
}

void MigrationEngine::Cancel() {
  cancel_requested_ = true;
  ARCHSTORE_LOG_INFO("migration cancel requested");
}

void MigrationEngine::Transition(MigrationState state) {
  ProgressCallback callback;
  events::MigrationEvent event;
  {
    std::lock_guard lock(state_mutex_);
    state_ = state;
    history_.push_back(state);
    callback           = progress_callback_;
    event.from_version = from_version_;
    event.to_version   = to_version_;
  }
  event.state    = MigrationStateName(state);
  event.progress = progress_.load();

  ARCHSTORE_LOG_INFO("migration state", {observability::StringField("state", event.state), observability::StringField("from", event.from_version),
                                         observability::StringField("to", event.to_version), observability::DoubleField("progress", event.progress)});
  if (bus_) bus_->migration.Publish(event);
  if (callback) callback(event.progress, state);
}

void MigrationEngine::SetProgress(double progress) {
  progress_ = progress;
  ProgressCallback callback;
  MigrationState   state;
  {
    std::lock_guard lock(state_mutex_);
    callback = progress_callback_;
    state    = state_;
  }
  if (callback) callback(progress, state);
}

void MigrationEngine::CheckInterrupted(std::chrono::steady_clock::time_point deadline) const {
  if (cancel_requested_) throw util::OperationCancelled("migration cancelled");
  if (options_.ticker() > deadline) {
    throw util::OperationTimedOut("migration exceeded " + std::to_string(options_.timeout.count()) + "ms");
  }
}

std::optional<std::string> MigrationEngine::StoredVersion(const fs::path& store_path) const {
  if (!fs::exists(store_path)) return std::nullopt;
  SqliteDB db(store_path.string(), SqliteDB::OpenMode::kReadOnly);
  return db::sqlite::ReadSchemaVersion(db).value_or("1.0");
}

bool MigrationEngine::CheckForRequiredMigration(const fs::path& store_path) {
  const auto stored  = StoredVersion(store_path);
  const auto current = catalog_->CurrentVersion();
  if (!stored || *stored == current) {
    Transition(MigrationState::kNotRequired);
    return false;
  }

  {
    std::lock_guard lock(state_mutex_);
    from_version_ = *stored;
    to_version_   = current;
  }
  Transition(MigrationState::kRequired);
  ARCHSTORE_LOG_INFO("migration required", {observability::StringField("store", store_path.string()), observability::StringField("stored", *stored),
                                            observability::StringField("current", current)});
  return true;
}

MigrationPlan MigrationEngine::PlanMigration(const std::string& from, const std::string& to) const {
  if (!catalog_->Has(from) || !catalog_->Has(to)) throw util::MigrationPathNotFound(from, to);
  return registry_->Graph().ShortestPath(from, to);
}

archstore::v1::StoreDiagnostics MigrationEngine::Diagnostics(const fs::path& store_path) const {
  archstore::v1::StoreDiagnostics diagnostics;
  diagnostics.set_store_path(store_path.string());
  diagnostics.set_current_version(catalog_->CurrentVersion());

  const auto stored = StoredVersion(store_path);
  diagnostics.set_exists(stored.has_value());
  if (!stored) return diagnostics;

  std::error_code ec;
  diagnostics.set_size_bytes(fs::file_size(store_path, ec));
  diagnostics.set_schema_version(*stored);
  diagnostics.set_compatible(*stored == catalog_->CurrentVersion());
  diagnostics.set_migration_required(!diagnostics.compatible());

  if (diagnostics.migration_required()) {
    try {
      for (const auto& version : PlanMigration(*stored, catalog_->CurrentVersion()).Path()) diagnostics.add_planned_path(version);
    } catch (const util::MigrationPathNotFound& e) {
      ARCHSTORE_LOG_WARN("no migration path", {observability::StringField("error", e.what())});
    }
  }
  return diagnostics;
}

fs::path MigrationEngine::RunStep(const MigrationStep& step, const fs::path& source, const fs::path& store_path,
                                  std::chrono::steady_clock::time_point deadline) {
  observability::SpanScope span("archstore.migration.step");
  span.SetAttribute("from", step.source);
  span.SetAttribute("to", step.target);

  const auto mapping     = registry_->MappingFor(step, *catalog_);
  const auto destination = WithSuffix(store_path, ".migrated_" + step.target);
  RemoveTriplet(destination);

  uint64_t records = 0;
  uint64_t dropped = 0;
  {
    auto             source_db = std::make_shared<SqliteDB>(source.string());
    SqliteRepository source_repo(source_db);

    auto dest_db = std::make_shared<SqliteDB>(destination.string());
    db::sqlite::BootstrapStore(*dest_db, step.target);
    SqliteRepository dest_repo(dest_db);

    auto source_tx = source_repo.BeginRead();
    auto dest_tx   = dest_repo.Begin();

    db::RecordQuery page;
    page.limit = options_.batch_size;
    while (true) {
      CheckInterrupted(deadline);
      auto batch = source_repo.ListRecords(*source_tx, page);
      if (batch.empty()) break;
      for (const auto& record : batch) {
        auto mapped = mapping.Apply(record);
        if (!mapped) {
          ++dropped;
          continue;
        }
        db::ThrowIfError(dest_repo.InsertRecord(*dest_tx, *mapped), "migrate record " + record.id);
        ++records;
      }
      page.after_id = batch.back().id;
    }

    for (const auto& version : source_repo.ListAllVersions(*source_tx)) {
      db::ThrowIfError(dest_repo.InsertVersion(*dest_tx, version), "migrate version " + version.id);
    }
    for (const auto& repair : source_repo.ListRepairRecords(*source_tx)) {
      db::ThrowIfError(dest_repo.InsertRepairRecord(*dest_tx, repair), "migrate repair record " + repair.id);
    }

    dest_tx->Commit();
    source_tx->Commit();
  }

  ARCHSTORE_LOG_INFO("migration step done", {observability::StringField("from", step.source), observability::StringField("to", step.target),
                                             observability::StringField("strategy", MappingStrategyName(step.strategy)),
                                             observability::IntField("records", static_cast<std::int64_t>(records)),
                                             observability::IntField("dropped", static_cast<std::int64_t>(dropped))});
  return destination;
}

void MigrationEngine::Swap(const fs::path& migrated, const fs::path& store_path) {
  const auto temp = WithSuffix(store_path, ".migration_temp");
  RemoveTriplet(temp);
  MoveTriplet(store_path, temp);
  MoveTriplet(migrated, store_path);
  RemoveTriplet(temp);
}

void MigrationEngine::Validate(const fs::path& store_path, const std::string& expected_version) {
  auto       store   = std::make_shared<SqliteDB>(store_path.string());
  const auto version = db::sqlite::ReadSchemaVersion(*store);
  if (version != expected_version) {
    throw util::MigrationFailed("migrated store reports schema " + version.value_or("<none>") + ", expected " + expected_version);
  }

  SqliteRepository repo(store);
  auto             tx = repo.BeginRead();
  for (const auto& entity : catalog_->Get(expected_version).entities) {
    auto query  = db::RecordQuery::ForEntity(entity.name);
    query.limit = 1;
    repo.ListRecords(*tx, query);
  }
  tx->Commit();
}

void MigrationEngine::Rollback(const BackupRecord& backup, const fs::path& store_path) {
  Transition(MigrationState::kRollingBack);
  backups_->RestoreBackup(backup, store_path);
  backups_->CleanupTemporaryFiles(store_path);
  Transition(MigrationState::kRollbackCompleted);
}

MigrationHistory MigrationEngine::History() const {
  std::lock_guard  lock(history_file_mutex_);
  MigrationHistory history;
  if (options_.history_path.empty() || !fs::exists(options_.history_path)) return history;

  std::ifstream     in(options_.history_path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  google::protobuf::util::JsonParseOptions parse;
  parse.ignore_unknown_fields = true;
  auto status                 = google::protobuf::util::JsonStringToMessage(buffer.str(), &history, parse);
  if (!status.ok()) throw util::CorruptionError("migration history " + options_.history_path.string() + " is malformed: " + status.ToString());
  return history;
}

void MigrationEngine::AppendHistory(const MigrationHistoryEntry& entry) {
  if (options_.history_path.empty()) return;

  auto            history = History();
  std::lock_guard lock(history_file_mutex_);
  *history.add_entries() = entry;

  google::protobuf::util::JsonPrintOptions print;
  print.add_whitespace = true;
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(history, &json, print);
  if (!status.ok()) throw util::InvalidState("cannot encode migration history: " + status.ToString());

  const auto tmp = WithSuffix(options_.history_path, ".tmp");
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << json;
    if (!out) throw util::StorageIOError("cannot write " + tmp.string());
  }
  Rename(tmp, options_.history_path);
}

MigrationHistoryEntry MigrationEngine::Migrate(const fs::path& store_path) {
  observability::SpanScope span("archstore.migration");

  const auto started  = std::chrono::steady_clock::now();
  const auto deadline = options_.ticker() + options_.timeout;
  cancel_requested_   = false;
  progress_           = 0.0;
  {
    std::lock_guard lock(state_mutex_);
    history_.clear();
  }

  MigrationHistoryEntry entry;
  *entry.mutable_started_at() = util::ToProto(options_.clock());

  auto finish = [&](bool success, const std::string& error) {
    entry.set_success(success);
    entry.set_error(error);
    *entry.mutable_finished_at() = util::ToProto(options_.clock());
    for (auto state : StateHistory()) entry.add_states(MigrationStateName(state));

    const double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    observability::Metrics::Instance().ObserveMigrationDurationMs(success, elapsed);
    try {
      AppendHistory(entry);
    } catch (const util::StoreError& e) {
      ARCHSTORE_LOG_ERROR("cannot record migration history", {observability::StringField("error", e.what())});
    }
  };

  Transition(MigrationState::kPreparing);

  MigrationPlan plan;
  try {
    const auto stored = StoredVersion(store_path);
    if (!stored) throw util::NotFound("store " + store_path.string() + " does not exist");
    const auto target = catalog_->CurrentVersion();
    entry.set_from_version(*stored);
    entry.set_to_version(target);
    {
      std::lock_guard lock(state_mutex_);
      from_version_ = *stored;
      to_version_   = target;
    }
    if (*stored == target) {
      entry.set_success(true);
      SetProgress(1.0);
      Transition(MigrationState::kNotRequired);
      return entry;
    }
    plan = PlanMigration(*stored, target);
  } catch (const util::StoreError& e) {
    Transition(MigrationState::kFailed);
    finish(false, e.what());
    throw;
  }
  for (const auto& version : plan.Path()) entry.add_path(version);

  Transition(MigrationState::kBackingUp);
  BackupRecord backup;
  try {
    CheckpointStore(store_path);
    backup = backups_->CreateBackup(store_path, archstore::v1::BACKUP_TYPE_PRE_MIGRATION, plan.source);
  } catch (const util::StoreError& e) {
    Transition(MigrationState::kFailed);
    finish(false, e.what());
    throw;
  }
  entry.set_backup_id(backup.id());
  SetProgress(0.1);
  SetProgress(0.2);

  Transition(MigrationState::kMigrating);
  try {
    auto       current = store_path;
    const auto total   = plan.steps.size();
    for (std::size_t i = 0; i < total; ++i) {
      CheckInterrupted(deadline);
      auto next = RunStep(plan.steps[i], current, store_path, deadline);
      if (current != store_path) RemoveTriplet(current);
      current = std::move(next);
      SetProgress(0.2 + 0.6 * static_cast<double>(i + 1) / static_cast<double>(total));
    }
    CheckInterrupted(deadline);
    Swap(current, store_path);

    Transition(MigrationState::kValidating);
    Validate(store_path, plan.target);
    SetProgress(0.95);
  } catch (const std::exception& e) {
    const std::string error = e.what();
    span.RecordException(error);
    ARCHSTORE_LOG_ERROR("migration failed, rolling back", {observability::StringField("store", store_path.string()),
                                                           observability::StringField("backup_id", backup.id()),
                                                           observability::StringField("error", error)});
    Transition(MigrationState::kRollbackRequired);
    try {
      Rollback(backup, store_path);
    } catch (const std::exception& rollback_error) {
      Transition(MigrationState::kFailed);
      ARCHSTORE_LOG_CRITICAL("migration rollback failed", {observability::StringField("store", store_path.string()),
                                                           observability::StringField("backup", backup.backup_path()),
                                                           observability::StringField("error", rollback_error.what())});
      finish(false, error + "; rollback failed: " + rollback_error.what());
      throw util::RollbackFailure("restore of " + store_path.string() + " from " + backup.backup_path() + " failed: " + rollback_error.what());
    }
    Transition(MigrationState::kFailed);
    finish(false, error);

    if (dynamic_cast<const util::OperationCancelled*>(&e) || dynamic_cast<const util::OperationTimedOut*>(&e)) throw;
    throw util::MigrationFailed("migration " + plan.source + " -> " + plan.target + " failed: " + error);
  }

  try {
    backups_->CleanupTemporaryFiles(store_path);
  } catch (const util::StoreError& e) {
    ARCHSTORE_LOG_WARN("cannot remove migration leftovers", {observability::StringField("error", e.what())});
  }

  SetProgress(1.0);
  Transition(MigrationState::kCompleted);
  finish(true, "");
  ARCHSTORE_LOG_INFO("migration completed", {observability::StringField("from", plan.source), observability::StringField("to", plan.target),
                                             observability::IntField("steps", static_cast<std::int64_t>(plan.steps.size()))});
  return entry;
}

} // namespace archstore::migration
