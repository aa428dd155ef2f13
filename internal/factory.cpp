#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"

namespace archstore::factory {

namespace fs = std::filesystem;

using archstore::runtime::config::RuntimeConfig;

namespace {

history::VersionOptions VersionOptionsFrom(const RuntimeConfig& config) {
  const auto&             history = config.history();
  history::VersionOptions options;
  options.max_versions      = history.max_versions();
  options.min_auto_interval = util::ToMillis(history.min_auto_interval());
  options.author            = history.author();
  options.app_version       = history.app_version();
  return options;
}

integrity::IntegrityOptions IntegrityOptionsFrom(const RuntimeConfig& config) {
  const auto&                 integrity = config.integrity();
  integrity::IntegrityOptions options;
  options.valid_threshold      = integrity.valid_threshold();
  options.auto_repair          = integrity.auto_repair();
  options.quick_check_sample   = integrity.quick_check_sample();
  options.quick_check_budget   = util::ToMillis(integrity.quick_check_budget());
  options.full_check_timeout   = util::ToMillis(integrity.full_check_timeout());
  options.max_entity_count     = integrity.max_entity_count();
  options.max_payload_bytes    = integrity.max_payload_bytes();
  options.min_free_bytes       = integrity.min_free_bytes();
  options.max_issues_per_check = integrity.max_issues_per_check();
  return options;
}

struct OpenStore {
  std::shared_ptr<db::sqlite::SqliteDB>   db;
  std::shared_ptr<storage::StorageEngine> engine;
};

OpenStore OpenEngine(const std::string& path, std::shared_ptr<const model::SchemaModel> schema, std::shared_ptr<events::EventBus> bus,
                     const RuntimeConfig& config) {
  OpenStore store;
  store.db = std::make_shared<db::sqlite::SqliteDB>(path);
  db::sqlite::BootstrapStore(*store.db, schema->version);

  const auto stored = db::sqlite::ReadSchemaVersion(*store.db);
  if (stored != schema->version) {
    throw util::InvalidState("store " + path + " is at schema " + stored.value_or("1.0") + ", expected " + schema->version);
  }

  storage::EngineOptions options;
  options.conflict_policy = storage::FromConfig(config.store().conflict_policy());

  auto repository = std::make_shared<db::sqlite::SqliteRepository>(store.db);
  store.engine    = std::make_shared<storage::StorageEngine>(store.db, std::move(repository), std::move(schema), std::move(bus), options);
  return store;
}

// Snapshots every project with the schema the store still has, so a
// migration can be undone per project later.
void SnapshotProjects(const RuntimeConfig& config, const std::shared_ptr<const model::SchemaCatalog>& catalog,
                      const std::shared_ptr<const migration::MigrationRegistry>& registry, const std::string& stored_version,
                      const std::string& target_version) {
  if (!catalog->Has(stored_version)) return;

  auto store = OpenEngine(config.store().path(), catalog->Share(stored_version), nullptr, config);

  auto options         = VersionOptionsFrom(config);
  options.max_versions = 0;
  history::VersionManager versions(store.engine, catalog, registry, options);

  std::vector<std::string> projects;
  store.engine->RunRead([&](db::Repository& repo, db::Transaction& tx) {
    projects = repo.ListRecordIds(tx, db::RecordQuery::ForEntity(model::kProjectEntity));
  });

  for (const auto& project_id : projects) {
    try {
      versions.CreateVersion(project_id, archstore::v1::VERSION_TYPE_BEFORE_MIGRATION, "Before migration to " + target_version);
    } catch (const util::StoreError& e) {
      ARCHSTORE_LOG_WARN("pre-migration snapshot failed", {observability::StringField("project_id", project_id),
                                                           observability::StringField("error", e.what())});
    }
  }
  store.engine->Close();

  ARCHSTORE_LOG_INFO("pre-migration snapshots taken", {observability::IntField("projects", static_cast<std::int64_t>(projects.size())),
                                                      observability::StringField("schema", stored_version)});
}

// Full scan of the old-schema store before it is rewritten. Findings are
// reported, not repaired: repairs would run against the outgoing schema.
void CheckBeforeMigration(const RuntimeConfig& config, const std::shared_ptr<const model::SchemaCatalog>& catalog,
                          const std::string& stored_version) {
  if (!catalog->Has(stored_version)) return;

  auto store          = OpenEngine(config.store().path(), catalog->Share(stored_version), nullptr, config);
  auto options        = IntegrityOptionsFrom(config);
  options.auto_repair = false;
  integrity::IntegrityChecker checker(store.engine, nullptr, options);

  const auto result = checker.RunFullCheck();
  store.engine->Close();

  if (!result.valid) {
    ARCHSTORE_LOG_WARN("store has integrity issues before migration", {observability::DoubleField("score", result.score),
                                                                      observability::IntField("issues", static_cast<std::int64_t>(result.issues.size())),
                                                                      observability::StringField("schema", stored_version)});
  }
}

} // namespace

std::shared_ptr<backup::BackupManager> BuildBackupManager(const RuntimeConfig& config) {
  backup::BackupOptions options;
  options.directory         = config.backup().directory();
  options.retention         = std::chrono::hours(24 * config.backup().retention_days());
  options.max_copy_attempts = config.backup().max_copy_attempts();
  options.retry_backoff     = util::ToMillis(config.backup().retry_backoff());
  return std::make_shared<backup::BackupManager>(std::move(options));
}

std::shared_ptr<migration::MigrationEngine> BuildMigrationEngine(const RuntimeConfig& config, std::shared_ptr<backup::BackupManager> backups,
                                                                 std::shared_ptr<events::EventBus> bus) {
  migration::MigrationOptions options;
  options.timeout      = util::ToMillis(config.migration().timeout());
  options.history_path = backups->Directory() / "migration_history.json";

  auto catalog = std::make_shared<const model::SchemaCatalog>(model::BuiltInSchemas());
  return std::make_shared<migration::MigrationEngine>(std::move(catalog), migration::BuiltInMigrations(), std::move(backups), std::move(bus),
                                                      std::move(options));
}

StoreRuntime BuildRuntime(const RuntimeConfig& config) {
  StoreRuntime runtime;
  runtime.config   = config;
  runtime.catalog  = std::make_shared<const model::SchemaCatalog>(model::BuiltInSchemas());
  runtime.registry = migration::BuiltInMigrations();
  runtime.bus      = std::make_shared<events::EventBus>();

  const auto& path = config.store().path();
  if (path.empty()) throw util::InvalidState("store.path is required");

  // ------------------------------------------------------------------
  // Backups and migration
  // ------------------------------------------------------------------
  runtime.backups    = BuildBackupManager(config);
  runtime.migrations = BuildMigrationEngine(config, runtime.backups, runtime.bus);

  const auto& current = runtime.catalog->CurrentVersion();
  const auto  stored  = runtime.migrations->StoredVersion(path);
  if (stored && *stored != current) {
    if (!config.migration().auto_migrate()) {
      throw util::InvalidState("store " + path + " is at schema " + *stored + " and automatic migration is disabled");
    }
    CheckBeforeMigration(config, runtime.catalog, *stored);
    if (config.migration().snapshot_projects()) SnapshotProjects(config, runtime.catalog, runtime.registry, *stored, current);
    runtime.migration = runtime.migrations->Migrate(path);
  }

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  auto store     = OpenEngine(path, runtime.catalog->Share(current), runtime.bus, config);
  runtime.engine = std::move(store.engine);

  // ------------------------------------------------------------------
  // History and integrity
  // ------------------------------------------------------------------
  runtime.versions = std::make_shared<history::VersionManager>(runtime.engine, runtime.catalog, runtime.registry, VersionOptionsFrom(config));
  runtime.changes  = std::make_shared<history::ChangeTracker>(runtime.bus);

  history::AutoSaveOptions autosave;
  autosave.interval  = util::ToMillis(config.history().autosave_interval());
  autosave.threshold = config.history().significant_change_threshold();
  runtime.autosave   = std::make_shared<history::AutoSaveWorker>(runtime.engine, runtime.versions, runtime.changes, autosave);

  runtime.integrity = std::make_shared<integrity::IntegrityChecker>(runtime.engine, runtime.backups, IntegrityOptionsFrom(config));
  runtime.monitor   = std::make_shared<integrity::IntegrityMonitor>(runtime.integrity, runtime.bus,
                                                                  util::ToMillis(config.integrity().quick_check_interval()));

  if (config.integrity().check_on_open()) runtime.integrity->RunQuickCheck();

  ARCHSTORE_LOG_INFO("store opened", {observability::StringField("path", path), observability::StringField("schema", current),
                                      observability::StringField("conflict_policy", storage::ConflictPolicyName(runtime.engine->Policy())),
                                      observability::BoolField("migrated", runtime.migration.has_value())});
  return runtime;
}

BuildResult TryBuildRuntime(const RuntimeConfig& config) {
  BuildResult result;
  try {
    result.runtime = BuildRuntime(config);
  } catch (const util::StoreError& e) {
    result.error_class = e.Class();
    result.error       = e.what();
  } catch (const std::exception& e) {
    result.error = e.what();
  }
  if (!result.ok()) ARCHSTORE_LOG_ERROR("store failed to open", {observability::StringField("error", result.error)});
  return result;
}

void StoreRuntime::StartWorkers() {
  if (config.history().autosave_enabled()) autosave->Start();
  monitor->Start();
}

void StoreRuntime::Shutdown() {
  if (monitor) monitor->Stop();
  if (autosave) {
    autosave->Stop();
    if (!engine->Failed()) autosave->Tick();
  }
  if (engine) engine->Close();
}

} // namespace archstore::factory
