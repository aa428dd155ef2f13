#include "internal/history/version_manager.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using archstore::db::model::Record;
using archstore::history::VersionManager;
using archstore::history::VersionOptions;
using archstore::storage::StorageEngine;
using archstore::util::TimePoint;
using archstore::v1::VersionInfo;

struct Harness {
  std::shared_ptr<archstore::db::sqlite::SqliteDB> db;
  std::shared_ptr<TimePoint>                       now = std::make_shared<TimePoint>(archstore::util::Now());
  std::shared_ptr<StorageEngine>                   engine;
  std::shared_ptr<VersionManager>                  versions;
  Record                                           project;
  Record                                           desk;
};

Harness Open(const std::string& name, VersionOptions options = {}) {
  const auto dir = fs::temp_directory_path() / "archstore_version_manager_tests";
  fs::create_directories(dir);
  const auto path = dir / (name + ".sqlite");
  for (const char* suffix : {"", "-wal", "-shm"}) fs::remove(path.string() + suffix);

  auto catalog = std::make_shared<archstore::model::SchemaCatalog>(archstore::model::BuiltInSchemas());

  Harness harness;
  harness.db = std::make_shared<archstore::db::sqlite::SqliteDB>(path.string());
  archstore::db::sqlite::BootstrapStore(*harness.db, catalog->CurrentVersion());

  archstore::storage::EngineOptions engine_options;
  auto                              now = harness.now;
  engine_options.clock                  = [now] { return *now; };

  auto repo        = std::make_shared<archstore::db::sqlite::SqliteRepository>(harness.db);
  harness.engine   = std::make_shared<StorageEngine>(harness.db, repo, catalog->Share(catalog->CurrentVersion()),
                                                     std::make_shared<archstore::events::EventBus>(), engine_options);
  harness.versions = std::make_shared<VersionManager>(harness.engine, catalog, archstore::migration::BuiltInMigrations(), options);

  auto view                            = harness.engine->ViewContext();
  harness.project                      = harness.engine->NewRecord(archstore::model::kProjectEntity);
  harness.project.fields["name"]       = std::string("Studio");
  harness.project.fields["created_at"] = std::int64_t{1700000000};
  harness.desk                         = harness.engine->NewRecord(archstore::model::kFurnitureEntity, harness.project.id);
  harness.desk.fields["name"]          = std::string("Desk");
  harness.desk.fields["category"]      = std::string("tables");
  harness.desk.fields["position_x"]    = 1.0;
  harness.desk.fields["position_y"]    = 0.0;
  harness.desk.fields["position_z"]    = 2.0;
  view->Insert(harness.project);
  view->Insert(harness.desk);
  harness.engine->Commit(view);
  return harness;
}

std::optional<Record> Durable(StorageEngine& engine, const std::string& id) {
  std::optional<Record> out;
  engine.RunRead([&](archstore::db::Repository& repo, archstore::db::Transaction& tx) { out = repo.GetRecord(tx, id); });
  return out;
}

void TestRestoreBringsBackSavedState() {
  auto  harness = Open("restore");
  auto& engine  = *harness.engine;
  auto  view    = engine.ViewContext();

  const auto saved = harness.versions->SaveManually(harness.project.id, "layout done");
  assert(saved.version_number() == 1);
  assert(saved.type() == archstore::v1::VERSION_TYPE_MANUAL);
  assert(saved.comment() == "layout done");
  assert(!saved.checksum().empty());

  auto chair                 = engine.NewRecord(archstore::model::kFurnitureEntity, harness.project.id);
  chair.fields["name"]       = std::string("Chair");
  chair.fields["category"]   = std::string("seating");
  chair.fields["position_x"] = 0.0;
  chair.fields["position_y"] = 0.0;
  chair.fields["position_z"] = 0.0;
  view->SetField(harness.project.id, "name", std::string("Studio v2"));
  view->Delete(harness.desk.id);
  view->Insert(chair);
  engine.Commit(view);

  const auto safety = harness.versions->RestoreVersion(saved, harness.project.id);
  assert(safety.type() == archstore::v1::VERSION_TYPE_BEFORE_RESTORE);
  assert(safety.version_number() == 2);

  assert(Durable(engine, harness.project.id)->GetString("name") == "Studio");
  assert(Durable(engine, harness.desk.id)->GetDouble("position_z") == 2.0);
  assert(!Durable(engine, chair.id).has_value());
  assert(view->Get(harness.project.id)->GetString("name") == "Studio");

  // the safety version holds the replaced state and can undo the restore
  harness.versions->RestoreVersion(safety, harness.project.id);
  assert(Durable(engine, harness.project.id)->GetString("name") == "Studio v2");
  assert(Durable(engine, chair.id).has_value());
  assert(!Durable(engine, harness.desk.id).has_value());

  const auto listed = harness.versions->ListVersions(harness.project.id);
  assert(listed.size() == 3);
  assert(listed.back().version_number() == 3);
}

void TestConcurrentCreatorsGetDistinctNumbers() {
  auto harness = Open("concurrent");

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&harness] {
      for (int i = 0; i < 10; ++i) harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_CHECKPOINT);
    });
  }
  for (auto& thread : threads) thread.join();

  std::set<uint64_t> numbers;
  for (const auto& version : harness.versions->ListVersions(harness.project.id)) numbers.insert(version.version_number());
  assert(numbers.size() == 40);
  assert(*numbers.begin() == 1);
  assert(*numbers.rbegin() == 40);
}

void TestAutomaticVersionsAreRateLimited() {
  auto harness = Open("rate_limit");
  auto now     = harness.now;

  harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_AUTOMATIC);

  *now += std::chrono::seconds(10);
  bool threw = false;
  try {
    harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_AUTOMATIC);
  } catch (const archstore::util::TooFrequent&) {
    threw = true;
  }
  assert(threw);

  // only automatic versions are limited
  harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_MANUAL, "explicit");

  *now += std::chrono::seconds(51);
  const auto second = harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_AUTOMATIC);
  assert(second.version_number() == 3);
}

void TestManualVersionsCannotBeDeleted() {
  auto harness = Open("delete");

  const auto manual    = harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_MANUAL, "keep");
  const auto automatic = harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_AUTOMATIC);

  bool threw = false;
  try {
    harness.versions->DeleteVersion(manual);
  } catch (const archstore::util::OperationForbidden&) {
    threw = true;
  }
  assert(threw);

  harness.versions->DeleteVersion(automatic);
  assert(!harness.versions->GetVersion(automatic.id()).has_value());

  // numbers are never reused
  *harness.now += std::chrono::minutes(5);
  const auto next = harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_AUTOMATIC);
  assert(next.version_number() == 3);
  assert(harness.versions->GetVersionByNumber(harness.project.id, 1)->id() == manual.id());
}

void TestRetentionPrunesOldestNonManual() {
  VersionOptions options;
  options.min_auto_interval = std::chrono::milliseconds(0);
  auto harness              = Open("retention", options);

  const auto manual = harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_MANUAL, "milestone");
  for (int i = 0; i < 60; ++i) harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_AUTOMATIC);

  const auto listed = harness.versions->ListVersions(harness.project.id);
  assert(listed.size() == 50);
  assert(listed.front().id() == manual.id());
  assert(listed.back().version_number() == 61);
  // versions 2..12 were pruned
  assert(listed[1].version_number() == 13);

  const auto stats = harness.versions->Statistics(harness.project.id);
  assert(stats.total == 50);
  assert(stats.manual == 1);
  assert(stats.automatic == 49);
  assert(stats.total_bytes > 0);
}

void TestCorruptedPayloadIsRejected() {
  auto harness = Open("corruption");

  const auto saved = harness.versions->CreateVersion(harness.project.id, archstore::v1::VERSION_TYPE_MANUAL, "before damage");
  assert(harness.versions->VerifyVersion(saved));

  harness.db->Exec("UPDATE versions SET payload = CAST(replace(CAST(payload AS TEXT), 'Studio', 'Stadio') AS BLOB) WHERE id = '" + saved.id() +
                   "';");
  assert(!harness.versions->VerifyVersion(saved));

  bool threw = false;
  try {
    harness.versions->RestoreVersion(saved, harness.project.id);
  } catch (const archstore::util::CorruptionError& e) {
    threw = std::string(e.what()).find("corrupted version data") != std::string::npos;
  }
  assert(threw);

  // nothing was replaced and no safety version was taken
  assert(harness.versions->ListVersions(harness.project.id).size() == 1);
  assert(Durable(*harness.engine, harness.desk.id).has_value());
}

void TestUnknownProjectIsRejected() {
  auto harness = Open("unknown_project");

  bool threw = false;
  try {
    harness.versions->CreateVersion("no-such-project", archstore::v1::VERSION_TYPE_MANUAL);
  } catch (const archstore::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRestoreBringsBackSavedState();
  TestConcurrentCreatorsGetDistinctNumbers();
  TestAutomaticVersionsAreRateLimited();
  TestManualVersionsCannotBeDeleted();
  TestRetentionPrunesOldestNonManual();
  TestCorruptedPayloadIsRejected();
  TestUnknownProjectIsRejected();

  std::cout << "archstore_unit_version_manager: pass\n";
  return 0;
}
