#include "internal/history/autosave_worker.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/api/record_query.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

namespace fs = std::filesystem;

using archstore::history::AutoSaveOptions;
using archstore::history::AutoSaveWorker;
using archstore::history::ChangeTracker;
using archstore::history::VersionManager;
using archstore::storage::StorageEngine;
using archstore::util::TimePoint;

struct Harness {
  std::shared_ptr<TimePoint>      now = std::make_shared<TimePoint>(archstore::util::Now());
  std::shared_ptr<StorageEngine>  engine;
  std::shared_ptr<VersionManager> versions;
  std::shared_ptr<ChangeTracker>  tracker;
};

Harness Open(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "archstore_autosave_worker_tests";
  fs::create_directories(dir);
  const auto path = dir / (name + ".sqlite");
  for (const char* suffix : {"", "-wal", "-shm"}) fs::remove(path.string() + suffix);

  auto catalog = std::make_shared<archstore::model::SchemaCatalog>(archstore::model::BuiltInSchemas());
  auto db      = std::make_shared<archstore::db::sqlite::SqliteDB>(path.string());
  archstore::db::sqlite::BootstrapStore(*db, catalog->CurrentVersion());

  Harness harness;
  auto    now = harness.now;
  auto    bus = std::make_shared<archstore::events::EventBus>();

  archstore::storage::EngineOptions options;
  options.clock = [now] { return *now; };

  harness.engine = std::make_shared<StorageEngine>(db, std::make_shared<archstore::db::sqlite::SqliteRepository>(db),
                                                   catalog->Share(catalog->CurrentVersion()), bus, options);
  harness.versions = std::make_shared<VersionManager>(harness.engine, catalog, archstore::migration::BuiltInMigrations());
  harness.tracker  = std::make_shared<ChangeTracker>(bus);
  return harness;
}

std::string AddProject(StorageEngine& engine) {
  auto project                 = engine.NewRecord(archstore::model::kProjectEntity);
  project.fields["name"]       = std::string("Cabin");
  project.fields["created_at"] = std::int64_t{1700000000};
  engine.ViewContext()->Insert(project);
  return project.id;
}

void AddItems(StorageEngine& engine, const std::string& project_id, int count) {
  for (int i = 0; i < count; ++i) {
    auto item                 = engine.NewRecord(archstore::model::kFurnitureEntity, project_id);
    item.fields["name"]       = "Shelf " + std::to_string(i);
    item.fields["category"]   = std::string("storage");
    item.fields["position_x"] = static_cast<double>(i);
    item.fields["position_y"] = 0.0;
    item.fields["position_z"] = 0.0;
    engine.ViewContext()->Insert(item);
  }
}

void TestTickCommitsAndVersionsBusyProjects() {
  auto harness = Open("tick");

  AutoSaveOptions options;
  options.threshold = 5;
  AutoSaveWorker worker(harness.engine, harness.versions, harness.tracker, options);

  const auto project_id = AddProject(*harness.engine);
  AddItems(*harness.engine, project_id, 4);

  auto result = worker.Tick();
  assert(result.committed);
  assert(result.versions_created == 1);
  assert(!harness.engine->ViewContext()->HasChanges());
  assert(harness.tracker->Count(project_id) == 0);

  const auto versions = harness.versions->ListVersions(project_id);
  assert(versions.size() == 1);
  assert(versions[0].type() == archstore::v1::VERSION_TYPE_AUTOMATIC);
  assert(versions[0].comment() == "Auto-save after 5 changes");

  // below threshold: commit only
  AddItems(*harness.engine, project_id, 2);
  result = worker.Tick();
  assert(result.committed);
  assert(result.versions_created == 0);
  assert(harness.tracker->Count(project_id) == 2);
}

void TestRateLimitedVersionIsDeferred() {
  auto harness = Open("deferred");

  AutoSaveOptions options;
  options.threshold = 5;
  AutoSaveWorker worker(harness.engine, harness.versions, harness.tracker, options);

  const auto project_id = AddProject(*harness.engine);
  AddItems(*harness.engine, project_id, 4);
  assert(worker.Tick().versions_created == 1);

  AddItems(*harness.engine, project_id, 5);
  auto result = worker.Tick();
  assert(result.committed);
  assert(result.versions_created == 0);
  assert(result.deferred == 1);
  assert(harness.tracker->Count(project_id) == 5);

  *harness.now += std::chrono::seconds(61);
  result = worker.Tick();
  assert(!result.committed);
  assert(result.versions_created == 1);
  assert(harness.tracker->Count(project_id) == 0);
  assert(harness.versions->ListVersions(project_id).size() == 2);
}

void TestEntityWideBatchCountsTowardThreshold() {
  auto harness = Open("batch");

  AutoSaveOptions options;
  options.threshold = 5;
  AutoSaveWorker worker(harness.engine, harness.versions, harness.tracker, options);

  const auto project_id = AddProject(*harness.engine);
  AddItems(*harness.engine, project_id, 5);
  assert(worker.Tick().versions_created == 1);
  assert(harness.tracker->Count(project_id) == 0);

  *harness.now += std::chrono::seconds(61);

  // no project filter; counts come from the rows touched
  const auto updated = harness.engine->BatchUpdate(archstore::db::RecordQuery::ForEntity(archstore::model::kFurnitureEntity),
                                                   {{"category", std::string("archived")}});
  assert(updated.size() == 5);
  assert(harness.tracker->Count(project_id) == 5);

  const auto result = worker.Tick();
  assert(!result.committed);
  assert(result.versions_created == 1);
  assert(harness.versions->ListVersions(project_id).size() == 2);
}

void TestWorkerThreadCommitsPendingChanges() {
  auto harness = Open("thread");

  AutoSaveOptions options;
  options.interval  = std::chrono::milliseconds(20);
  options.threshold = 100;
  AutoSaveWorker worker(harness.engine, harness.versions, harness.tracker, options);

  const auto project_id = AddProject(*harness.engine);
  worker.Start();
  worker.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (harness.engine->ViewContext()->HasChanges() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker.Stop();
  worker.Stop();

  assert(!harness.engine->ViewContext()->HasChanges());
  assert(harness.tracker->Count(project_id) == 1);
  assert(harness.versions->ListVersions(project_id).empty());
}

} // namespace

int main() {
  TestTickCommitsAndVersionsBusyProjects();
  TestRateLimitedVersionIsDeferred();
  TestEntityWideBatchCountsTowardThreshold();
  TestWorkerThreadCommitsPendingChanges();

  std::cout << "archstore_unit_autosave_worker: pass\n";
  return 0;
}
