#include "internal/migration/migration_engine.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/storage/storage_engine.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using archstore::db::model::Record;
using archstore::migration::MigrationEngine;
using archstore::migration::MigrationOptions;
using archstore::migration::MigrationState;

struct LegacyStore {
  fs::path    dir;
  fs::path    path;
  std::string project_id;
  std::string room_id;
  std::string sofa_id;
};

fs::path Scratch(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "archstore_migration_engine_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

// A store written by an application still on schema `version`.
LegacyStore CreateLegacyStore(const std::string& name, const std::string& version = "1.0") {
  LegacyStore store;
  store.dir  = Scratch(name);
  store.path = store.dir / "home.sqlite";

  const auto catalog = archstore::model::BuiltInSchemas();
  auto       db      = std::make_shared<archstore::db::sqlite::SqliteDB>(store.path.string());
  archstore::db::sqlite::BootstrapStore(*db, version);
  if (!catalog.Has(version)) return store;

  archstore::storage::StorageEngine engine(db, std::make_shared<archstore::db::sqlite::SqliteRepository>(db), catalog.Share(version), nullptr);
  auto                              view = engine.ViewContext();

  auto project                 = engine.NewRecord(archstore::model::kProjectEntity);
  project.fields["name"]       = std::string("Farmhouse");
  project.fields["created_at"] = std::int64_t{1650000000};

  auto room = engine.NewRecord(archstore::model::kRoomEntity, project.id);
  room.fields[version == "2.0" ? "kind" : "room_type"] = std::string("living");
  room.fields["width"]                                 = 5.5;

  auto sofa                 = engine.NewRecord(archstore::model::kFurnitureEntity, project.id);
  sofa.fields["name"]       = std::string("Sofa");
  sofa.fields["category"]   = std::string("seating");
  sofa.fields["position_x"] = 1.0;
  sofa.fields["position_y"] = 0.0;
  sofa.fields["position_z"] = 3.0;
  sofa.relationships.push_back({"room", room.id, false});

  view->Insert(project);
  view->Insert(room);
  view->Insert(sofa);
  engine.Commit(view);
  engine.Close();

  store.project_id = project.id;
  store.room_id    = room.id;
  store.sofa_id    = sofa.id;
  return store;
}

struct Migrator {
  std::shared_ptr<archstore::backup::BackupManager> backups;
  std::shared_ptr<MigrationEngine>                  engine;
};

Migrator MakeMigrator(const LegacyStore& store,
                      std::shared_ptr<const archstore::migration::MigrationRegistry> registry = archstore::migration::BuiltInMigrations(),
                      archstore::util::SteadyFn ticker = archstore::util::SteadyNow) {
  Migrator migrator;
  migrator.backups = std::make_shared<archstore::backup::BackupManager>(archstore::backup::BackupOptions{store.dir / "backups"});

  MigrationOptions options;
  options.history_path = store.dir / "migration_history.json";
  options.batch_size   = 2;
  options.ticker       = std::move(ticker);

  migrator.engine = std::make_shared<MigrationEngine>(
      std::make_shared<archstore::model::SchemaCatalog>(archstore::model::BuiltInSchemas()), std::move(registry), migrator.backups,
      std::make_shared<archstore::events::EventBus>(), options);
  return migrator;
}

std::optional<Record> ReadRecord(const fs::path& path, const std::string& id) {
  auto                                    db = std::make_shared<archstore::db::sqlite::SqliteDB>(path.string());
  archstore::db::sqlite::SqliteRepository repo(db);
  auto                                    tx     = repo.BeginRead();
  auto                                    record = repo.GetRecord(*tx, id);
  tx->Commit();
  return record;
}

bool NoLeftovers(const LegacyStore& store) {
  for (const auto& entry : fs::directory_iterator(store.dir)) {
    const auto name = entry.path().filename().string();
    if (name.find(".migrated_") != std::string::npos || name.find(".migration_temp") != std::string::npos) return false;
  }
  return true;
}

void TestMigratesLegacyStoreToCurrentSchema() {
  const auto store    = CreateLegacyStore("success");
  auto       migrator = MakeMigrator(store);
  auto&      engine   = *migrator.engine;

  std::vector<double> progress;
  engine.SetProgressCallback([&](double value, MigrationState) { progress.push_back(value); });

  assert(engine.CheckForRequiredMigration(store.path));
  assert(engine.State() == MigrationState::kRequired);

  const auto entry = engine.Migrate(store.path);
  assert(entry.success());
  assert(entry.from_version() == "1.0");
  assert(entry.to_version() == "2.0");
  assert(entry.path_size() == 3);
  assert(entry.path(1) == "1.1");
  assert(engine.State() == MigrationState::kCompleted);

  const std::vector<MigrationState> expected{MigrationState::kPreparing, MigrationState::kBackingUp, MigrationState::kMigrating,
                                             MigrationState::kValidating, MigrationState::kCompleted};
  assert(engine.StateHistory() == expected);

  assert(!progress.empty());
  for (std::size_t i = 1; i < progress.size(); ++i) assert(progress[i] >= progress[i - 1]);
  assert(progress.back() == 1.0);

  assert(engine.StoredVersion(store.path) == std::optional<std::string>("2.0"));

  const auto room = ReadRecord(store.path, store.room_id);
  assert(room.has_value());
  assert(room->GetString("kind") == "living");
  assert(room->Find("room_type") == nullptr);
  assert(room->GetDouble("width") == 5.5);

  const auto project = ReadRecord(store.path, store.project_id);
  assert(project->GetInt("modified_at") == 1650000000);
  assert(project->GetString("settings") == "{}");

  const auto sofa = ReadRecord(store.path, store.sofa_id);
  assert(sofa->GetDouble("scale_y") == 1.0);
  assert(sofa->relationships.size() == 1);
  assert(sofa->relationships[0].target_id == store.room_id);

  const auto backups = migrator.backups->ListBackups();
  assert(backups.size() == 1);
  assert(backups[0].type() == archstore::v1::BACKUP_TYPE_PRE_MIGRATION);
  assert(backups[0].schema_version() == "1.0");
  assert(entry.backup_id() == backups[0].id());
  assert(NoLeftovers(store));

  const auto history = engine.History();
  assert(history.entries_size() == 1);
  assert(history.entries(0).success());

  assert(!engine.CheckForRequiredMigration(store.path));
}

void TestFailedStepRestoresOriginalStore() {
  const auto store = CreateLegacyStore("failure");

  auto registry = std::make_shared<archstore::migration::MigrationRegistry>();
  registry->RegisterInferred("1.0", "1.1");

  archstore::migration::CustomMapping broken;
  broken.transform = [](const Record& source, Record&) {
    if (source.entity == archstore::model::kFurnitureEntity) throw std::runtime_error("furniture transform exploded");
  };
  registry->RegisterCustom("1.1", "1.2", broken);

  archstore::migration::CustomMapping rename;
  rename.renames[archstore::model::kRoomEntity]["room_type"] = "kind";
  registry->RegisterCustom("1.2", "2.0", rename);

  auto  migrator = MakeMigrator(store, registry);
  auto& engine   = *migrator.engine;

  bool threw = false;
  try {
    engine.Migrate(store.path);
  } catch (const archstore::util::MigrationFailed& e) {
    threw = std::string(e.what()).find("furniture transform exploded") != std::string::npos;
  }
  assert(threw);
  assert(engine.State() == MigrationState::kFailed);

  const auto states = engine.StateHistory();
  assert(std::find(states.begin(), states.end(), MigrationState::kRollbackRequired) != states.end());
  assert(std::find(states.begin(), states.end(), MigrationState::kRollbackCompleted) != states.end());

  const auto backups = migrator.backups->ListBackups();
  assert(backups.size() == 1);
  assert(archstore::util::Sha256HexOfFile(store.path) == archstore::util::Sha256HexOfFile(backups[0].backup_path()));
  assert(engine.StoredVersion(store.path) == std::optional<std::string>("1.0"));
  assert(ReadRecord(store.path, store.room_id)->GetString("room_type") == "living");
  assert(NoLeftovers(store));

  const auto history = engine.History();
  assert(history.entries_size() == 1);
  assert(!history.entries(0).success());
  assert(!history.entries(0).error().empty());
}

void TestMissingPathFailsBeforeBackup() {
  const auto store    = CreateLegacyStore("no_path", "0.9");
  auto       migrator = MakeMigrator(store);

  bool threw = false;
  try {
    migrator.engine->Migrate(store.path);
  } catch (const archstore::util::MigrationPathNotFound& e) {
    threw = e.From() == "0.9" && e.To() == "2.0";
  }
  assert(threw);
  assert(migrator.engine->State() == MigrationState::kFailed);
  assert(migrator.backups->ListBackups().empty());

  const auto diagnostics = migrator.engine->Diagnostics(store.path);
  assert(diagnostics.exists());
  assert(diagnostics.migration_required());
  assert(diagnostics.planned_path_size() == 0);
}

void TestCurrentStoreNeedsNoMigration() {
  const auto store    = CreateLegacyStore("current", "2.0");
  auto       migrator = MakeMigrator(store);

  const auto entry = migrator.engine->Migrate(store.path);
  assert(entry.success());
  assert(migrator.engine->State() == MigrationState::kNotRequired);
  assert(migrator.backups->ListBackups().empty());

  const auto diagnostics = migrator.engine->Diagnostics(store.path);
  assert(diagnostics.compatible());
  assert(!diagnostics.migration_required());

  const auto missing = migrator.engine->Diagnostics(store.dir / "absent.sqlite");
  assert(!missing.exists());
  assert(!migrator.engine->StoredVersion(store.dir / "absent.sqlite").has_value());
}

void TestCancelRollsBack() {
  const auto store    = CreateLegacyStore("cancel");
  auto       migrator = MakeMigrator(store);
  auto*      engine   = migrator.engine.get();

  engine->SetProgressCallback([engine](double, MigrationState state) {
    if (state == MigrationState::kMigrating) engine->Cancel();
  });

  bool threw = false;
  try {
    engine->Migrate(store.path);
  } catch (const archstore::util::OperationCancelled&) {
    threw = true;
  }
  assert(threw);
  assert(engine->State() == MigrationState::kFailed);
  assert(engine->StoredVersion(store.path) == std::optional<std::string>("1.0"));
  assert(NoLeftovers(store));
}

void TestTimeoutRollsBack() {
  const auto store = CreateLegacyStore("timeout");

  // every reading is an hour past the previous one
  auto now      = std::make_shared<std::chrono::steady_clock::time_point>();
  auto migrator = MakeMigrator(store, archstore::migration::BuiltInMigrations(), [now] {
    *now += std::chrono::hours(1);
    return *now;
  });
  auto& engine = *migrator.engine;

  bool threw = false;
  try {
    engine.Migrate(store.path);
  } catch (const archstore::util::OperationTimedOut&) {
    threw = true;
  }
  assert(threw);

  const auto states = engine.StateHistory();
  assert(std::find(states.begin(), states.end(), MigrationState::kMigrating) != states.end());
  assert(std::find(states.begin(), states.end(), MigrationState::kRollingBack) != states.end());
  assert(std::find(states.begin(), states.end(), MigrationState::kRollbackCompleted) != states.end());
  assert(states.back() == MigrationState::kFailed);
  assert(engine.State() == MigrationState::kFailed);

  const auto backups = migrator.backups->ListBackups();
  assert(backups.size() == 1);
  assert(archstore::util::Sha256HexOfFile(store.path) == archstore::util::Sha256HexOfFile(backups[0].backup_path()));
  assert(engine.StoredVersion(store.path) == std::optional<std::string>("1.0"));
  assert(NoLeftovers(store));

  const auto history = engine.History();
  assert(history.entries_size() == 1);
  assert(!history.entries(0).success());
}

void TestDiagnosticsReportsPlannedPath() {
  const auto store    = CreateLegacyStore("diagnostics", "1.2");
  auto       migrator = MakeMigrator(store);

  const auto diagnostics = migrator.engine->Diagnostics(store.path);
  assert(diagnostics.schema_version() == "1.2");
  assert(diagnostics.current_version() == "2.0");
  assert(diagnostics.migration_required());
  assert(diagnostics.planned_path_size() == 2);
  assert(diagnostics.size_bytes() > 0);
}

} // namespace

int main() {
  TestMigratesLegacyStoreToCurrentSchema();
  TestFailedStepRestoresOriginalStore();
  TestMissingPathFailsBeforeBackup();
  TestCurrentStoreNeedsNoMigration();
  TestCancelRollsBack();
  TestTimeoutRollsBack();
  TestDiagnosticsReportsPlannedPath();

  std::cout << "archstore_unit_migration_engine: pass\n";
  return 0;
}
