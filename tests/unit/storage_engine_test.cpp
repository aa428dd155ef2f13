#include "internal/storage/storage_engine.hpp"

#include <cassert>
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
#include "internal/model/schema.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using archstore::db::RecordQuery;
using archstore::db::model::Record;
using archstore::events::CommitOrigin;
using archstore::events::CommitSummary;
using archstore::storage::ConflictPolicy;
using archstore::storage::EngineOptions;
using archstore::storage::Isolation;
using archstore::storage::StorageEngine;
using archstore::storage::WorkingContext;

struct Fixture {
  std::shared_ptr<archstore::events::EventBus> bus = std::make_shared<archstore::events::EventBus>();
  std::shared_ptr<StorageEngine>               engine;
  std::vector<CommitSummary>                   commits;
};

std::unique_ptr<Fixture> Open(const std::string& name, ConflictPolicy policy = ConflictPolicy::kLastWriterWins) {
  const auto dir = fs::temp_directory_path() / "archstore_storage_engine_tests";
  fs::create_directories(dir);
  const auto path = dir / (name + ".sqlite");
  for (const char* suffix : {"", "-wal", "-shm"}) fs::remove(path.string() + suffix);

  const auto catalog = archstore::model::BuiltInSchemas();
  auto       db      = std::make_shared<archstore::db::sqlite::SqliteDB>(path.string());
  archstore::db::sqlite::BootstrapStore(*db, catalog.CurrentVersion());

  EngineOptions options;
  options.conflict_policy = policy;

  auto fixture    = std::make_unique<Fixture>();
  auto repo       = std::make_shared<archstore::db::sqlite::SqliteRepository>(db);
  fixture->engine = std::make_shared<StorageEngine>(db, repo, catalog.Share(catalog.CurrentVersion()), fixture->bus, options);

  auto* raw = fixture.get();
  fixture->bus->commits.Subscribe([raw](const CommitSummary& summary) { raw->commits.push_back(summary); });
  return fixture;
}

Record NewProject(StorageEngine& engine, const std::string& name) {
  auto project                 = engine.NewRecord(archstore::model::kProjectEntity);
  project.fields["name"]       = name;
  project.fields["created_at"] = std::int64_t{1700000000};
  return project;
}

Record NewFurniture(StorageEngine& engine, const std::string& project_id, const std::string& name) {
  auto item                 = engine.NewRecord(archstore::model::kFurnitureEntity, project_id);
  item.fields["name"]       = name;
  item.fields["category"]   = std::string("seating");
  item.fields["position_x"] = 0.0;
  item.fields["position_y"] = 0.0;
  item.fields["position_z"] = 0.0;
  return item;
}

std::optional<Record> Durable(StorageEngine& engine, const std::string& id) {
  std::optional<Record> out;
  engine.RunRead([&](archstore::db::Repository& repo, archstore::db::Transaction& tx) { out = repo.GetRecord(tx, id); });
  return out;
}

void TestCommitMakesChangesDurable() {
  auto  fixture = Open("commit");
  auto& engine  = *fixture->engine;
  auto  view    = engine.ViewContext();

  auto project = NewProject(engine, "Loft");
  auto sofa    = NewFurniture(engine, project.id, "Sofa");
  view->Insert(project);
  view->Insert(sofa);

  const auto summary = engine.Commit(view);
  assert(summary.sequence == 1);
  assert(summary.inserted.size() == 2);
  assert(summary.changes_by_project.at(project.id) == 2);
  assert(!view->HasChanges());

  auto durable = Durable(engine, sofa.id);
  assert(durable.has_value());
  assert(durable->revision == 1);
  assert(durable->GetDouble("scale_x") == 1.0);

  assert(fixture->commits.size() == 1);
  assert(fixture->commits[0].origin == CommitOrigin::kLocal);

  // nothing pending: no new sequence, no event
  const auto empty = engine.Commit(view);
  assert(empty.Empty());
  assert(fixture->commits.size() == 1);
  assert(engine.LastSequence() == 1);
}

void TestInvalidRecordFailsWholeCommit() {
  auto  fixture = Open("validation");
  auto& engine  = *fixture->engine;
  auto  context = engine.OpenContext(Isolation::kBackground);

  auto project = NewProject(engine, "Loft");
  auto broken  = NewFurniture(engine, project.id, "Broken");
  broken.fields.erase("category");
  context->Insert(project);
  context->Insert(broken);

  bool threw = false;
  try {
    engine.Commit(context);
  } catch (const archstore::util::ValidationError& e) {
    threw = e.RecordId() == broken.id;
  }
  assert(threw);
  assert(!Durable(engine, project.id).has_value());
  assert(context->HasChanges());
  assert(fixture->commits.empty());
}

void TestRecordMustReferenceExistingProject() {
  auto  fixture = Open("missing_project");
  auto& engine  = *fixture->engine;
  auto  context = engine.OpenContext(Isolation::kBackground);

  context->Insert(NewFurniture(engine, "no-such-project", "Stray"));

  bool threw = false;
  try {
    engine.Commit(context);
  } catch (const archstore::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestRunAtomicRollsBackOnFailure() {
  auto  fixture = Open("atomic");
  auto& engine  = *fixture->engine;
  auto  context = engine.OpenContext(Isolation::kBackground);

  auto project = NewProject(engine, "Loft");
  context->Insert(project);
  engine.Commit(context);

  auto stool = NewFurniture(engine, project.id, "Stool");

  bool threw = false;
  try {
    engine.RunAtomic(context, {[&](WorkingContext& ctx) { ctx.SetField(project.id, "name", std::string("Half done")); },
                               [&](WorkingContext& ctx) { ctx.Insert(stool); },
                               [](WorkingContext&) { throw std::runtime_error("third operation failed"); }});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  assert(!context->HasChanges());
  assert(context->Get(project.id)->GetString("name") == "Loft");
  assert(!context->Get(stool.id).has_value());
  assert(Durable(engine, project.id)->GetString("name") == "Loft");
  assert(engine.LastSequence() == 1);

  const auto summary = engine.RunAtomic(context, [&](WorkingContext& ctx) {
    ctx.SetField(project.id, "name", std::string("Done"));
    ctx.Insert(stool);
  });
  assert(summary.inserted.size() == 1);
  assert(summary.updated.size() == 1);
  assert(Durable(engine, project.id)->GetString("name") == "Done");
}

// Two background contexts edit the same field of the same record; the
// second commit meets a newer durable revision.
struct Contested {
  std::unique_ptr<Fixture>        fixture;
  Record                          project;
  std::shared_ptr<WorkingContext> first;
  std::shared_ptr<WorkingContext> second;
};

Contested Contest(const std::string& name, ConflictPolicy policy) {
  Contested contested;
  contested.fixture = Open(name, policy);
  auto& engine      = *contested.fixture->engine;

  contested.project = NewProject(engine, "Original");
  auto seed         = engine.OpenContext(Isolation::kBackground);
  seed->Insert(contested.project);
  engine.Commit(seed);

  contested.first  = engine.OpenContext(Isolation::kBackground);
  contested.second = engine.OpenContext(Isolation::kBackground);
  assert(contested.first->Get(contested.project.id).has_value());
  assert(contested.second->Get(contested.project.id).has_value());

  contested.first->SetField(contested.project.id, "name", std::string("First"));
  contested.second->SetField(contested.project.id, "name", std::string("Second"));
  contested.second->SetField(contested.project.id, "description", std::string("only second"));
  engine.Commit(contested.first);
  return contested;
}

void TestLastWriterWins() {
  auto  contested = Contest("last_writer_wins", ConflictPolicy::kLastWriterWins);
  auto& engine    = *contested.fixture->engine;

  const auto summary = engine.Commit(contested.second);
  assert(summary.conflicts_resolved == 1);

  const auto durable = Durable(engine, contested.project.id);
  assert(durable->GetString("name") == "Second");
  assert(durable->GetString("description") == "only second");
  assert(durable->revision == 3);
}

void TestStoreWins() {
  auto  contested = Contest("store_wins", ConflictPolicy::kStoreWins);
  auto& engine    = *contested.fixture->engine;

  const auto summary = engine.Commit(contested.second);
  assert(summary.conflicts_resolved == 1);

  const auto durable = Durable(engine, contested.project.id);
  assert(durable->GetString("name") == "First");
  // uncontested fields still merge
  assert(durable->GetString("description") == "only second");
}

void TestSurfaceConflict() {
  auto  contested = Contest("surface_conflict", ConflictPolicy::kSurfaceConflict);
  auto& engine    = *contested.fixture->engine;

  bool threw = false;
  try {
    engine.Commit(contested.second);
  } catch (const archstore::util::ConflictError& e) {
    threw = e.RecordId() == contested.project.id && e.Field() == "name";
  }
  assert(threw);
  assert(Durable(engine, contested.project.id)->GetString("name") == "First");
  assert(contested.second->HasChanges());
}

// One context deletes a chair and commits while another has a pending
// rename of it.
struct EditedAfterDelete {
  std::unique_ptr<Fixture>        fixture;
  Record                          chair;
  std::shared_ptr<WorkingContext> editor;
};

EditedAfterDelete DeleteUnderEdit(const std::string& name, ConflictPolicy policy) {
  EditedAfterDelete edited;
  edited.fixture = Open(name, policy);
  auto& engine   = *edited.fixture->engine;

  auto project = NewProject(engine, "Studio");
  edited.chair = NewFurniture(engine, project.id, "Chair");
  auto seed    = engine.OpenContext(Isolation::kBackground);
  seed->Insert(project);
  seed->Insert(edited.chair);
  engine.Commit(seed);

  auto remover  = engine.OpenContext(Isolation::kBackground);
  edited.editor = engine.OpenContext(Isolation::kBackground);
  assert(remover->Get(edited.chair.id).has_value());
  assert(edited.editor->Get(edited.chair.id).has_value());

  remover->Delete(edited.chair.id);
  engine.Commit(remover);
  assert(!Durable(engine, edited.chair.id).has_value());

  edited.editor->SetField(edited.chair.id, "name", std::string("Armchair"));
  return edited;
}

void TestEditOfDeletedRecordSurfacesConflict() {
  auto  edited = DeleteUnderEdit("deleted_surface", ConflictPolicy::kSurfaceConflict);
  auto& engine = *edited.fixture->engine;

  bool threw = false;
  try {
    engine.Commit(edited.editor);
  } catch (const archstore::util::ConflictError& e) {
    threw = e.RecordId() == edited.chair.id;
  }
  assert(threw);
  assert(!Durable(engine, edited.chair.id).has_value());
  assert(edited.editor->HasChanges());
}

void TestEditOfDeletedRecordRestoresUnderLastWriterWins() {
  auto  edited = DeleteUnderEdit("deleted_local", ConflictPolicy::kLastWriterWins);
  auto& engine = *edited.fixture->engine;

  const auto summary = engine.Commit(edited.editor);
  assert(summary.conflicts_resolved == 1);
  assert(summary.updated.size() == 1);

  const auto durable = Durable(engine, edited.chair.id);
  assert(durable.has_value());
  assert(durable->GetString("name") == "Armchair");
  assert(durable->revision == 2);
  assert(!edited.editor->HasChanges());
}

void TestEditOfDeletedRecordDroppedUnderStoreWins() {
  auto  edited = DeleteUnderEdit("deleted_store", ConflictPolicy::kStoreWins);
  auto& engine = *edited.fixture->engine;

  const auto summary = engine.Commit(edited.editor);
  assert(summary.conflicts_resolved == 1);
  assert(summary.updated.empty());
  assert(!Durable(engine, edited.chair.id).has_value());
  assert(!edited.editor->Get(edited.chair.id).has_value());
}

void TestDisjointFieldsMergeWithoutConflict() {
  auto  fixture = Open("disjoint", ConflictPolicy::kSurfaceConflict);
  auto& engine  = *fixture->engine;

  auto project = NewProject(engine, "Loft");
  auto seed    = engine.OpenContext(Isolation::kBackground);
  seed->Insert(project);
  engine.Commit(seed);

  auto first  = engine.OpenContext(Isolation::kBackground);
  auto second = engine.OpenContext(Isolation::kBackground);
  first->SetField(project.id, "name", std::string("Renamed"));
  second->SetField(project.id, "tags", std::string("modern"));
  engine.Commit(first);

  const auto summary = engine.Commit(second);
  assert(summary.conflicts_resolved == 0);

  const auto durable = Durable(engine, project.id);
  assert(durable->GetString("name") == "Renamed");
  assert(durable->GetString("tags") == "modern");
}

void TestViewSeesBackgroundCommits() {
  auto  fixture = Open("view_merge");
  auto& engine  = *fixture->engine;
  auto  view    = engine.ViewContext();

  auto project = NewProject(engine, "Loft");
  view->Insert(project);
  engine.Commit(view);
  assert(view->Get(project.id)->GetString("name") == "Loft");

  auto background = engine.OpenContext(Isolation::kBackground);
  background->SetField(project.id, "name", std::string("Imported"));
  engine.Commit(background);

  assert(view->Get(project.id)->GetString("name") == "Imported");
}

void TestBatchOperations() {
  auto  fixture = Open("batch");
  auto& engine  = *fixture->engine;
  auto  view    = engine.ViewContext();

  auto project = NewProject(engine, "Loft");
  view->Insert(project);
  for (int i = 0; i < 4; ++i) view->Insert(NewFurniture(engine, project.id, "Chair " + std::to_string(i)));
  engine.Commit(view);

  auto query = RecordQuery::ForEntity(archstore::model::kFurnitureEntity);
  query.project_id = project.id;
  const auto updated = engine.BatchUpdate(query, {{"category", std::string("archived")}});
  assert(updated.size() == 4);
  assert(fixture->commits.back().changes_by_project.at(project.id) == 4);

  for (const auto& item : view->Fetch(query)) assert(item.GetString("category") == "archived");

  bool threw = false;
  try {
    engine.BatchUpdate(query, {{"position_x", std::string("left")}});
  } catch (const archstore::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  const auto deleted = engine.BatchDelete(RecordQuery::ForEntity(archstore::model::kFurnitureEntity).Where("name", std::string("Chair 0")));
  assert(deleted.size() == 1);
  assert(view->Fetch(query).size() == 3);
}

void TestExternalChangesCommitAsRemote() {
  auto  fixture = Open("external");
  auto& engine  = *fixture->engine;

  auto project = NewProject(engine, "Synced");
  auto lamp    = NewFurniture(engine, project.id, "Lamp");

  auto summary = engine.ApplyExternalChanges(
      {archstore::sync::ExternalChange::Upsert(project), archstore::sync::ExternalChange::Upsert(lamp)});
  assert(summary.origin == CommitOrigin::kRemote);
  assert(summary.inserted.size() == 2);

  lamp.fields["rotation"] = 45.0;
  summary                 = engine.ApplyExternalChanges({archstore::sync::ExternalChange::Upsert(lamp)});
  assert(summary.updated.size() == 1);
  assert(Durable(engine, lamp.id)->GetDouble("rotation") == 45.0);

  summary = engine.ApplyExternalChanges({archstore::sync::ExternalChange::Delete(lamp.id)});
  assert(summary.deleted.size() == 1);
  assert(!Durable(engine, lamp.id).has_value());
  assert(fixture->commits.back().origin == CommitOrigin::kRemote);
}

void TestClosedEngineRejectsCommits() {
  auto  fixture = Open("closed");
  auto& engine  = *fixture->engine;
  auto  view    = engine.ViewContext();

  view->Insert(NewProject(engine, "Late"));
  engine.Close();

  bool threw = false;
  try {
    engine.Commit(view);
  } catch (const archstore::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCommitMakesChangesDurable();
  TestInvalidRecordFailsWholeCommit();
  TestRecordMustReferenceExistingProject();
  TestRunAtomicRollsBackOnFailure();
  TestLastWriterWins();
  TestStoreWins();
  TestSurfaceConflict();
  TestEditOfDeletedRecordSurfacesConflict();
  TestEditOfDeletedRecordRestoresUnderLastWriterWins();
  TestEditOfDeletedRecordDroppedUnderStoreWins();
  TestDisjointFieldsMergeWithoutConflict();
  TestViewSeesBackgroundCommits();
  TestBatchOperations();
  TestExternalChangesCommitAsRemote();
  TestClosedEngineRejectsCommits();

  std::cout << "archstore_unit_storage_engine: pass\n";
  return 0;
}
