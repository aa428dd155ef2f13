#include "internal/integrity/integrity_checker.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/history/version_manager.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using archstore::db::model::Record;
using archstore::integrity::IntegrityChecker;
using archstore::integrity::IntegrityOptions;
using archstore::storage::StorageEngine;

struct Harness {
  fs::path                          dir;
  std::shared_ptr<StorageEngine>    engine;
  std::string                       project_id;
  std::shared_ptr<IntegrityChecker> checker;
};

IntegrityOptions TestOptions() {
  IntegrityOptions options;
  options.min_free_bytes = 0;
  return options;
}

Harness Open(const std::string& name) {
  Harness harness;
  harness.dir = fs::temp_directory_path() / "archstore_integrity_checker_tests" / name;
  fs::remove_all(harness.dir);
  fs::create_directories(harness.dir);
  const auto path = harness.dir / "home.sqlite";

  const auto catalog = archstore::model::BuiltInSchemas();
  auto       db      = std::make_shared<archstore::db::sqlite::SqliteDB>(path.string());
  archstore::db::sqlite::BootstrapStore(*db, catalog.CurrentVersion());
  harness.engine = std::make_shared<StorageEngine>(db, std::make_shared<archstore::db::sqlite::SqliteRepository>(db),
                                                   catalog.Share(catalog.CurrentVersion()), std::make_shared<archstore::events::EventBus>());

  auto view                    = harness.engine->ViewContext();
  auto project                 = harness.engine->NewRecord(archstore::model::kProjectEntity);
  project.fields["name"]       = std::string("Bungalow");
  project.fields["created_at"] = std::int64_t{1700000000};
  auto lamp                    = harness.engine->NewRecord(archstore::model::kFurnitureEntity, project.id);
  lamp.fields["name"]          = std::string("Lamp");
  lamp.fields["category"]      = std::string("lighting");
  lamp.fields["position_x"]    = 0.5;
  lamp.fields["position_y"]    = 1.5;
  lamp.fields["position_z"]    = 0.0;
  view->Insert(project);
  view->Insert(lamp);
  harness.engine->Commit(view);

  harness.project_id = project.id;
  harness.checker    = std::make_shared<IntegrityChecker>(harness.engine, nullptr, TestOptions());
  return harness;
}

// Writes below the engine so no validation runs.
void InsertRaw(StorageEngine& engine, const Record& record) {
  engine.RunSerialized([&](archstore::db::Repository& repo, archstore::db::Transaction& tx) {
    archstore::db::ThrowIfError(repo.InsertRecord(tx, record), "insert " + record.id);
  });
}

Record Orphan(const std::string& id) {
  Record record;
  record.id                   = id;
  record.entity               = archstore::model::kFurnitureEntity;
  record.project_id           = "missing-project";
  record.fields["name"]       = std::string("Stray chair");
  record.fields["category"]   = std::string("seating");
  record.fields["position_x"] = 0.0;
  record.fields["position_y"] = 0.0;
  record.fields["position_z"] = 0.0;
  record.revision             = 1;
  return record;
}

// Each reading is an hour past the previous one, so any deadline passes at
// the first look.
archstore::util::SteadyFn RunawayTicker() {
  auto now = std::make_shared<std::chrono::steady_clock::time_point>();
  return [now] {
    *now += std::chrono::hours(1);
    return *now;
  };
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestCleanStoreScoresPerfect() {
  auto harness = Open("clean");

  const auto result = harness.checker->RunFullCheck();
  assert(result.issues.empty());
  assert(result.score == 1.0);
  assert(result.valid);
  assert(result.complete);
  assert(!result.auto_repair.has_value());
  assert(harness.checker->Progress() == 1.0);
}

void TestOrphanIsCriticalAndNeedsManualRepair() {
  auto harness = Open("orphan");
  InsertRaw(*harness.engine, Orphan("orphan-1"));

  const auto result = harness.checker->RunFullCheck();
  assert(result.issues.size() == 1);
  const auto& issue = result.issues[0];
  assert(issue.id() == "orphaned_record:orphan-1:project_id");
  assert(issue.severity() == archstore::v1::ISSUE_SEVERITY_CRITICAL);
  assert(issue.repairable());
  assert(Near(result.score, 0.95));
  // critical issues are never auto-repaired
  assert(!result.auto_repair.has_value());
  assert(archstore::integrity::OutstandingRepairs(result).size() == 1);

  // unchanged store, same report
  const auto again = harness.checker->RunFullCheck();
  assert(again.issues.size() == 1);
  assert(again.issues[0].id() == issue.id());

  const auto repair = harness.checker->Repair(result.issues, archstore::v1::REPAIR_TYPE_MANUAL);
  assert(repair.attempted() == 1);
  assert(repair.repaired() == 1);
  assert(repair.failed() == 0);
  assert(harness.checker->RunFullCheck().issues.empty());

  const auto report = harness.checker->GetReport();
  assert(report.repair_history_size() == 1);
  assert(report.repair_history(0).type() == archstore::v1::REPAIR_TYPE_MANUAL);
}

void TestFullCheckAutoRepairsWarnings() {
  auto harness = Open("auto_repair");
  auto view    = harness.engine->ViewContext();

  view->SetField(harness.project_id, "name", std::string(""));
  harness.engine->Commit(view);

  auto shelf                 = harness.engine->NewRecord(archstore::model::kFurnitureEntity, harness.project_id);
  shelf.fields["name"]       = std::string("Shelf");
  shelf.fields["category"]   = std::string("storage");
  shelf.fields["position_x"] = 0.0;
  shelf.fields["position_y"] = 0.0;
  shelf.fields["position_z"] = 0.0;
  shelf.fields["metadata"]   = std::string("{\"finish\": oak");
  shelf.revision             = 1;
  InsertRaw(*harness.engine, shelf);

  const auto result = harness.checker->RunFullCheck();
  assert(result.issues.size() == 2);
  for (const auto& issue : result.issues) assert(issue.severity() == archstore::v1::ISSUE_SEVERITY_WARNING);
  assert(Near(result.score, 0.94));
  assert(result.auto_repair.has_value());
  assert(result.auto_repair->repaired() == 2);
  assert(result.auto_repaired.size() == 2);
  assert(archstore::integrity::OutstandingRepairs(result).empty());

  const auto after = harness.checker->RunFullCheck();
  assert(after.issues.empty());

  Record project;
  Record repaired;
  harness.engine->RunRead([&](archstore::db::Repository& repo, archstore::db::Transaction& tx) {
    project  = *repo.GetRecord(tx, harness.project_id);
    repaired = *repo.GetRecord(tx, shelf.id);
  });
  assert(project.GetString("name") == "Untitled Project");
  assert(repaired.GetString("metadata") == "{}");
}

void TestRecordWithTwoBadFieldsIsRepairedTogether() {
  auto harness = Open("two_fields");

  auto table                 = harness.engine->NewRecord(archstore::model::kFurnitureEntity, harness.project_id);
  table.fields["name"]       = std::string("Table");
  table.fields["category"]   = std::string("tables");
  table.fields["position_x"] = 0.0;
  table.fields["position_y"] = 0.0;
  table.fields["position_z"] = 0.0;
  table.fields["rotation"]   = std::string("ninety");
  table.fields["scale_x"]    = std::string("big");
  table.revision             = 1;
  InsertRaw(*harness.engine, table);

  const auto result = harness.checker->RunFullCheck();
  assert(result.issues.size() == 2);
  for (const auto& issue : result.issues) {
    assert(issue.id() == "invalid_field:" + table.id + ":rotation" || issue.id() == "invalid_field:" + table.id + ":scale_x");
    assert(issue.repairable());
  }
  assert(!result.auto_repair.has_value());

  const auto repair = harness.checker->Repair(result.issues, archstore::v1::REPAIR_TYPE_MANUAL);
  assert(repair.attempted() == 2);
  assert(repair.repaired() == 2);
  assert(repair.failed() == 0);

  assert(harness.checker->RunFullCheck().issues.empty());

  Record repaired;
  harness.engine->RunRead([&](archstore::db::Repository& repo, archstore::db::Transaction& tx) { repaired = *repo.GetRecord(tx, table.id); });
  assert(Near(*repaired.GetDouble("rotation"), 0.0));
  assert(Near(*repaired.GetDouble("scale_x"), 1.0));
}

void TestQuickCheckNeverRepairs() {
  auto harness = Open("quick");
  auto view    = harness.engine->ViewContext();
  view->SetField(harness.project_id, "name", std::string(""));
  harness.engine->Commit(view);

  const auto quick = harness.checker->RunQuickCheck();
  assert(quick.quick);
  assert(quick.issues.size() == 1);
  assert(quick.issues[0].id() == "invalid_field:" + harness.project_id + ":name");
  assert(!quick.auto_repair.has_value());

  assert(harness.checker->RunQuickCheck().issues.size() == 1);
}

void TestFullCheckTimesOut() {
  auto harness = Open("full_timeout");

  auto options   = TestOptions();
  options.ticker = RunawayTicker();
  IntegrityChecker checker(harness.engine, nullptr, options);

  bool threw = false;
  try {
    checker.RunFullCheck();
  } catch (const archstore::util::OperationTimedOut&) {
    threw = true;
  }
  assert(threw);
  // the aborted run leaves no result behind
  assert(!checker.GetReport().has_last_check_date());
}

void TestQuickCheckStopsAtBudget() {
  auto harness = Open("quick_budget");
  auto view    = harness.engine->ViewContext();
  view->SetField(harness.project_id, "name", std::string(""));
  harness.engine->Commit(view);

  auto options   = TestOptions();
  options.ticker = RunawayTicker();
  IntegrityChecker checker(harness.engine, nullptr, options);

  const auto partial = checker.RunQuickCheck();
  assert(partial.quick);
  assert(!partial.complete);
  assert(partial.issues.empty());

  const auto unhurried = harness.checker->RunQuickCheck();
  assert(unhurried.complete);
  assert(unhurried.issues.size() == 1);
}

void TestChecksumMismatchIsRepairable() {
  auto harness = Open("checksum");

  auto catalog  = std::make_shared<archstore::model::SchemaCatalog>(archstore::model::BuiltInSchemas());
  auto versions = std::make_shared<archstore::history::VersionManager>(harness.engine, catalog, archstore::migration::BuiltInMigrations());
  const auto version = versions->CreateVersion(harness.project_id, archstore::v1::VERSION_TYPE_MANUAL, "baseline");

  harness.engine->RunSerialized([&](archstore::db::Repository& repo, archstore::db::Transaction& tx) {
    archstore::db::ThrowIfError(repo.UpdateVersionChecksum(tx, version.id(), std::string(64, '0')), "damage checksum");
  });
  assert(!versions->VerifyVersion(version));

  const auto result = harness.checker->RunFullCheck();
  assert(result.issues.size() == 1);
  assert(result.issues[0].id() == "corrupted_checksum:" + version.id() + ":checksum");
  assert(result.issues[0].severity() == archstore::v1::ISSUE_SEVERITY_CRITICAL);
  assert(result.issues[0].repairable());

  const auto repair = harness.checker->Repair(result.issues, archstore::v1::REPAIR_TYPE_MANUAL);
  assert(repair.repaired() == 1);
  assert(versions->VerifyVersion(version));
  assert(harness.checker->RunFullCheck().issues.empty());
}

void TestManyCriticalIssuesInvalidateStore() {
  auto harness = Open("many_orphans");
  for (int i = 0; i < 5; ++i) InsertRaw(*harness.engine, Orphan("orphan-" + std::to_string(i)));

  const auto result = harness.checker->RunFullCheck();
  assert(result.issues.size() == 5);
  assert(Near(result.score, 0.75));
  assert(!result.valid);
  assert(result.issues.front().id() == "orphaned_record:orphan-0:project_id");

  const auto report = harness.checker->GetReport();
  assert(report.total_issues() == 5);
  assert(report.issues_by_type().at("orphaned_record") == 5);
  assert(report.issues_by_severity().at("critical") == 5);
  assert(!report.valid());
  assert(report.recommendations_size() == 2);
  assert(report.recommendations(0) == "Consider running a full integrity repair");
  assert(report.recommendations(1) == "Critical issues require immediate attention");
}

class Unreachable : public archstore::sync::RemoteSyncStatus {
 public:
  bool IsReachable() override {
    return false;
  }

  std::string Describe() const override {
    return "cloud mirror";
  }
};

void TestHealthReportsSyncAndBackups() {
  auto       harness = Open("health");
  const auto backups = std::make_shared<archstore::backup::BackupManager>(archstore::backup::BackupOptions{harness.dir / "backups"});

  harness.engine->Checkpoint();
  const auto backup = backups->CreateBackup(harness.engine->Path(), archstore::v1::BACKUP_TYPE_MANUAL);
  fs::remove(backup.backup_path());

  IntegrityOptions options = TestOptions();
  options.auto_repair      = false;
  IntegrityChecker checker(harness.engine, backups, options);
  checker.AttachRemoteSync(std::make_shared<Unreachable>());

  const auto result = checker.RunFullCheck();
  assert(result.issues.size() == 2);
  assert(result.issues[0].id() == "backup:" + backup.id() + ":backup_path");
  assert(result.issues[0].repairable());
  assert(result.issues[1].id() == "sync:cloud mirror:reachability");
  assert(!result.issues[1].repairable());

  const auto repair = checker.Repair(result.issues, archstore::v1::REPAIR_TYPE_MANUAL);
  assert(repair.attempted() == 1);
  assert(repair.repaired() == 1);
  assert(!backups->FindBackup(backup.id()).has_value());

  const auto after = checker.RunFullCheck();
  assert(after.issues.size() == 1);
  assert(after.issues[0].type() == archstore::v1::ISSUE_TYPE_SYNC);
}

void TestScoreWeights() {
  archstore::integrity::Issues issues(3);
  issues[0].set_severity(archstore::v1::ISSUE_SEVERITY_CRITICAL);
  issues[1].set_severity(archstore::v1::ISSUE_SEVERITY_WARNING);
  issues[2].set_severity(archstore::v1::ISSUE_SEVERITY_INFO);
  assert(Near(archstore::integrity::ComputeScore(issues), 0.91));
  assert(archstore::integrity::ComputeScore({}) == 1.0);

  archstore::integrity::Issues flood(40);
  for (auto& issue : flood) issue.set_severity(archstore::v1::ISSUE_SEVERITY_CRITICAL);
  assert(archstore::integrity::ComputeScore(flood) == 0.0);
}

} // namespace

int main() {
  TestCleanStoreScoresPerfect();
  TestOrphanIsCriticalAndNeedsManualRepair();
  TestFullCheckAutoRepairsWarnings();
  TestRecordWithTwoBadFieldsIsRepairedTogether();
  TestQuickCheckNeverRepairs();
  TestFullCheckTimesOut();
  TestQuickCheckStopsAtBudget();
  TestChecksumMismatchIsRepairable();
  TestManyCriticalIssuesInvalidateStore();
  TestHealthReportsSyncAndBackups();
  TestScoreWeights();

  std::cout << "archstore_unit_integrity_checker: pass\n";
  return 0;
}
