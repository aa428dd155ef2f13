#include "storage_engine.hpp"

#include <algorithm>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace archstore::storage {

using db::model::FieldValue;
using db::model::Record;

namespace {

constexpr const char* kRelationshipsField = "<relationships>";
constexpr const char* kProjectIdField     = "<project_id>";
constexpr const char* kDeletedMarker      = "<deleted>";

bool SameValue(const FieldValue* a, const FieldValue* b) {
  if (!a || !b) return a == b;
  return *a == *b;
}

void LogResolution(const std::string& record_id, const std::string& field, const char* winner) {
  ARCHSTORE_LOG_WARN("merge conflict resolved", {observability::StringField("record_id", record_id), observability::StringField("field", field),
                                                 observability::StringField("winner", winner)});
}

} // namespace

ConflictPolicy FromConfig(archstore::runtime::config::ConflictPolicy policy) {
  switch (policy) {
    case archstore::runtime::config::CONFLICT_POLICY_STORE_WINS:
      return ConflictPolicy::kStoreWins;
    case archstore::runtime::config::CONFLICT_POLICY_SURFACE_CONFLICT:
      return ConflictPolicy::kSurfaceConflict;
    default:
      return ConflictPolicy::kLastWriterWins;
  }
}

const char* ConflictPolicyName(ConflictPolicy policy) {
  switch (policy) {
    case ConflictPolicy::kLastWriterWins:
      return "last_writer_wins";
    case ConflictPolicy::kStoreWins:
      return "store_wins";
    case ConflictPolicy::kSurfaceConflict:
      return "surface_conflict";
  }
  return "unknown";
}

StorageEngine::StorageEngine(std::shared_ptr<db::sqlite::SqliteDB> db, std::shared_ptr<db::Repository> repository,
                             std::shared_ptr<const model::SchemaModel> schema, std::shared_ptr<events::EventBus> bus, EngineOptions options)
    : db_(std::move(db)),
      repository_(std::move(repository)),
      schema_(std::move(schema)),
      bus_(std::move(bus)),
      options_(std::move(options)),
      validator_(schema_) {
  if (!options_.clock) options_.clock = util::Now;
  view_ = std::make_shared<WorkingContext>(next_context_id_++, Isolation::kDefault, repository_);
  contexts_.push_back(view_);

  ARCHSTORE_LOG_INFO("storage engine opened", {observability::StringField("path", db_->Path()),
                                               observability::StringField("schema_version", schema_->version),
                                               observability::StringField("conflict_policy", ConflictPolicyName(options_.conflict_policy))});
}

void StorageEngine::RequireOpen() const {
  if (closed_) throw util::InvalidState("store " + db_->Path() + " is closed");
  if (failed_) throw util::InvalidState("store " + db_->Path() + " failed after a fatal error");
}

void StorageEngine::MarkFailedIfFatal(const util::StoreError& error) {
  if (!util::IsFatal(error)) return;
  failed_ = true;
  ARCHSTORE_LOG_CRITICAL("storage engine failed", {observability::StringField("path", db_->Path()), observability::StringField("error", error.what()),
                                                    observability::StringField("class", util::ErrorClassName(error.Class()))});
}

std::shared_ptr<WorkingContext> StorageEngine::OpenContext(Isolation isolation) {
  if (isolation == Isolation::kDefault) return view_;

  auto context = std::make_shared<WorkingContext>(next_context_id_++, isolation, repository_);

  std::lock_guard lock(contexts_mutex_);
  std::erase_if(contexts_, [](const auto& weak) { return weak.expired(); });
  contexts_.push_back(context);
  return context;
}

Record StorageEngine::NewRecord(const std::string& entity, const std::string& project_id) const {
  const auto* spec = schema_->FindEntity(entity);
  if (!spec) throw util::ValidationError("", "unknown entity '" + entity + "'");

  Record record;
  record.id     = util::NewId();
  record.entity = entity;
  if (entity == model::kProjectEntity) {
    record.project_id = record.id;
  } else if (!spec->catalog) {
    record.project_id = project_id;
  }
  schema_->ApplyDefaults(record);
  return record;
}

Record StorageEngine::ResolveConflict(const WorkingContext::Tracked& local, const Record& durable, uint32_t& conflicts) {
  const auto& base   = *local.baseline;
  const auto& mine   = local.current;
  auto        merged = durable;

  std::set<std::string> names;
  for (const auto& [name, _] : base.fields) names.insert(name);
  for (const auto& [name, _] : mine.fields) names.insert(name);

  // true when the local side wins
  auto decide = [&](const std::string& field, bool contested) {
    if (!contested) return true;
    ++conflicts;
    switch (options_.conflict_policy) {
      case ConflictPolicy::kLastWriterWins:
        LogResolution(mine.id, field, "local");
        return true;
      case ConflictPolicy::kStoreWins:
        LogResolution(mine.id, field, "store");
        return false;
      case ConflictPolicy::kSurfaceConflict:
        break;
    }
    throw util::ConflictError(mine.id, field);
  };

  for (const auto& name : names) {
    const auto* local_value = mine.Find(name);
    const auto* base_value  = base.Find(name);
    if (SameValue(local_value, base_value)) continue;

    if (!decide(name, !SameValue(durable.Find(name), base_value))) continue;
    if (local_value) {
      merged.fields[name] = *local_value;
    } else {
      merged.fields.erase(name);
    }
  }

  if (mine.project_id != base.project_id && decide(kProjectIdField, durable.project_id != base.project_id)) {
    merged.project_id = mine.project_id;
  }
  if (mine.relationships != base.relationships && decide(kRelationshipsField, durable.relationships != base.relationships)) {
    merged.relationships = mine.relationships;
  }
  return merged;
}

StorageEngine::Staged StorageEngine::StageCommit(WorkingContext& context, db::Transaction& tx, uint64_t now_ms) {
  Staged staged;

  std::vector<const WorkingContext::Tracked*> inserts;
  std::vector<const WorkingContext::Tracked*> updates;
  std::vector<const WorkingContext::Tracked*> deletes;
  std::set<std::string>                       deleting;
  for (const auto& [id, tracked] : context.objects_) {
    if (!tracked.Dirty()) continue;
    if (tracked.deleted) {
      deletes.push_back(&tracked);
      deleting.insert(id);
    } else if (tracked.inserted) {
      inserts.push_back(&tracked);
    } else {
      updates.push_back(&tracked);
    }
  }

  auto exists = [&](const std::string& id) {
    if (deleting.contains(id)) return false;
    auto it = context.objects_.find(id);
    if (it != context.objects_.end() && it->second.Dirty()) return true;
    return repository_->GetRecord(tx, id).has_value();
  };

  for (const auto* tracked : inserts) validator_.Validate(tracked->current, exists);
  for (const auto* tracked : updates) validator_.Validate(tracked->current, exists);

  auto& summary = staged.summary;
  auto  count   = [&summary](const std::string& project_id) {
    if (!project_id.empty()) ++summary.changes_by_project[project_id];
  };

  for (const auto* tracked : inserts) {
    auto record          = tracked->current;
    record.revision      = 1;
    record.created_at_ms = now_ms;
    record.updated_at_ms = now_ms;

    auto res = repository_->InsertRecord(tx, record);
    if (res.code == db::ErrorCode::AlreadyExists) throw util::ValidationError(record.id, "id already exists in the store");
    db::ThrowIfError(res, "insert record " + record.id);

    summary.inserted.push_back(record.id);
    count(record.project_id);
    staged.written.push_back(std::move(record));
  }

  for (const auto* tracked : updates) {
    const auto& id      = tracked->current.id;
    auto        durable = repository_->GetRecord(tx, id);
    if (!durable) {
      // edited here, deleted by another context since the baseline was read
      ++summary.conflicts_resolved;
      switch (options_.conflict_policy) {
        case ConflictPolicy::kStoreWins:
          LogResolution(id, kDeletedMarker, "store");
          staged.removed.push_back(id);
          continue;
        case ConflictPolicy::kLastWriterWins: {
          LogResolution(id, kDeletedMarker, "local");
          auto record          = tracked->current;
          record.revision      = tracked->baseline->revision + 1;
          record.created_at_ms = tracked->baseline->created_at_ms;
          record.updated_at_ms = now_ms;

          auto res = repository_->InsertRecord(tx, record);
          if (res.code == db::ErrorCode::AlreadyExists) throw util::ConflictError(id, kDeletedMarker);
          db::ThrowIfError(res, "restore record " + id);

          summary.updated.push_back(id);
          count(record.project_id);
          staged.written.push_back(std::move(record));
          continue;
        }
        case ConflictPolicy::kSurfaceConflict:
          break;
      }
      throw util::ConflictError(id, kDeletedMarker);
    }

    Record record;
    if (durable->revision != tracked->baseline->revision) {
      record = ResolveConflict(*tracked, *durable, summary.conflicts_resolved);
      validator_.Validate(record, exists);
    } else {
      record = tracked->current;
    }
    record.revision      = durable->revision + 1;
    record.created_at_ms = durable->created_at_ms;
    record.updated_at_ms = now_ms;

    db::ThrowIfError(repository_->UpdateRecord(tx, record), "update record " + id);

    summary.updated.push_back(id);
    count(record.project_id);
    staged.written.push_back(std::move(record));
  }

  for (const auto* tracked : deletes) {
    const auto& record = *tracked->baseline;

    auto res = repository_->DeleteRecord(tx, record.id);
    if (res.code == db::ErrorCode::NotFound) {
      ARCHSTORE_LOG_DEBUG("record already deleted", {observability::StringField("record_id", record.id)});
    } else {
      db::ThrowIfError(res, "delete record " + record.id);
    }
    if (record.entity == model::kProjectEntity) {
      db::ThrowIfError(repository_->DeleteVersionsForProject(tx, record.id), "delete versions of " + record.id);
    }

    summary.deleted.push_back(record.id);
    count(record.project_id);
    staged.removed.push_back(record.id);
  }

  return staged;
}

CommitSummary StorageEngine::Commit(const std::shared_ptr<WorkingContext>& context, CommitOrigin origin) {
  RequireOpen();
  if (context->GetIsolation() == Isolation::kReadOnly) {
    throw util::InvalidState("cannot commit read-only context " + std::to_string(context->Id()));
  }

  observability::SpanScope span("archstore.commit");
  span.SetAttribute("origin", CommitOriginName(origin));

  Staged staged;
  {
    std::lock_guard commit_lock(commit_mutex_);
    {
      std::lock_guard context_lock(context->mutex_);
      const bool      dirty = std::any_of(context->objects_.begin(), context->objects_.end(),
                                          [](const auto& entry) { return entry.second.Dirty(); });
      if (!dirty) {
        CommitSummary empty;
        empty.sequence = sequence_.load();
        empty.origin   = origin;
        return empty;
      }

      const auto now_ms = util::ToUnixMillis(options_.clock());
      try {
        auto tx = repository_->Begin();
        staged  = StageCommit(*context, *tx, now_ms);
        tx->Commit();
      } catch (const util::StoreError& e) {
        MarkFailedIfFatal(e);
        span.RecordException(e.what());
        observability::Metrics::Instance().RecordCommit(CommitOriginName(origin), false);
        throw;
      }
      context->MarkCommittedLocked(staged.written, staged.removed);

      staged.summary.sequence        = ++sequence_;
      staged.summary.origin          = origin;
      staged.summary.committed_at_ms = now_ms;
    }

    if (context != view_) {
      ChangeSet changes{staged.summary.inserted, staged.summary.updated, staged.summary.deleted};
      view_->MergeCommitted(changes);
    }
  }

  ARCHSTORE_LOG_INFO("commit", {observability::IntField("sequence", static_cast<std::int64_t>(staged.summary.sequence)),
                                observability::StringField("origin", CommitOriginName(origin)),
                                observability::IntField("inserted", static_cast<std::int64_t>(staged.summary.inserted.size())),
                                observability::IntField("updated", static_cast<std::int64_t>(staged.summary.updated.size())),
                                observability::IntField("deleted", static_cast<std::int64_t>(staged.summary.deleted.size())),
                                observability::IntField("conflicts_resolved", staged.summary.conflicts_resolved)});
  observability::Metrics::Instance().RecordCommit(CommitOriginName(origin), true);

  Publish(staged.summary);
  return staged.summary;
}

CommitSummary StorageEngine::RunAtomic(const std::shared_ptr<WorkingContext>& context, const std::vector<AtomicOperation>& operations) {
  auto savepoint = context->CreateSavepoint();
  try {
    for (const auto& operation : operations) operation(*context);
    auto summary = Commit(context);
    context->Release(std::move(savepoint));
    return summary;
  } catch (const std::exception& e) {
    ARCHSTORE_LOG_WARN("atomic operation rolled back", {observability::IntField("context", static_cast<std::int64_t>(context->Id())),
                                                        observability::StringField("error", e.what())});
    try {
      context->RollbackTo(std::move(savepoint));
    } catch (const util::StoreError& rollback_error) {
      ARCHSTORE_LOG_CRITICAL("savepoint rollback failed", {observability::IntField("context", static_cast<std::int64_t>(context->Id())),
                                                            observability::StringField("error", rollback_error.what())});
      throw util::RollbackFailure(std::string("rollback after '") + e.what() + "' failed: " + rollback_error.what());
    }
    throw;
  }
}

CommitSummary StorageEngine::RunAtomic(const std::shared_ptr<WorkingContext>& context, const AtomicOperation& operation) {
  return RunAtomic(context, std::vector<AtomicOperation>{operation});
}

std::vector<std::string> StorageEngine::BatchUpdate(const db::RecordQuery& query, const db::model::FieldMap& assignments) {
  RequireOpen();

  if (query.entity) {
    const auto* entity = schema_->FindEntity(*query.entity);
    if (!entity) throw util::ValidationError("", "unknown entity '" + *query.entity + "'");
    for (const auto& [name, value] : assignments) {
      const auto* field = entity->FindField(name);
      if (!field) throw util::ValidationError("", "unknown field '" + name + "' on " + entity->name);
      const bool null_value = std::holds_alternative<std::monostate>(value);
      if ((null_value && field->required) || (!null_value && !model::MatchesKind(value, field->kind))) {
        throw util::ValidationError("", "invalid value for '" + name + "': " + db::model::DescribeValue(value));
      }
    }
  }

  CommitSummary summary;
  {
    std::lock_guard commit_lock(commit_mutex_);
    const auto      now_ms = util::ToUnixMillis(options_.clock());
    try {
      auto tx                    = repository_->Begin();
      auto result                = repository_->BatchUpdate(*tx, query, assignments, now_ms);
      tx->Commit();
      summary.updated            = std::move(result.ids);
      summary.changes_by_project = std::move(result.changes_by_project);
    } catch (const util::StoreError& e) {
      MarkFailedIfFatal(e);
      throw;
    }
    summary.sequence        = ++sequence_;
    summary.committed_at_ms = now_ms;
    RefreshContexts();
  }

  ARCHSTORE_LOG_INFO("batch update", {observability::IntField("updated", static_cast<std::int64_t>(summary.updated.size()))});
  Publish(summary);
  return summary.updated;
}

std::vector<std::string> StorageEngine::BatchDelete(const db::RecordQuery& query) {
  RequireOpen();

  CommitSummary summary;
  {
    std::lock_guard commit_lock(commit_mutex_);
    const auto      now_ms = util::ToUnixMillis(options_.clock());
    try {
      auto tx                    = repository_->Begin();
      auto result                = repository_->BatchDelete(*tx, query);
      tx->Commit();
      summary.deleted            = std::move(result.ids);
      summary.changes_by_project = std::move(result.changes_by_project);
    } catch (const util::StoreError& e) {
      MarkFailedIfFatal(e);
      throw;
    }
    summary.sequence        = ++sequence_;
    summary.committed_at_ms = now_ms;
    RefreshContexts();
  }

  ARCHSTORE_LOG_INFO("batch delete", {observability::IntField("deleted", static_cast<std::int64_t>(summary.deleted.size()))});
  Publish(summary);
  return summary.deleted;
}

CommitSummary StorageEngine::ApplyExternalChanges(const sync::ExternalChangeSet& changes) {
  auto context = OpenContext(Isolation::kBackground);
  for (const auto& change : changes) {
    const bool present = context->Get(change.record_id).has_value();
    if (change.kind == sync::ExternalChange::Kind::kDelete) {
      if (present) context->Delete(change.record_id);
      continue;
    }
    if (present) {
      context->Update(change.record);
    } else {
      context->Insert(change.record);
    }
  }
  return Commit(context, CommitOrigin::kRemote);
}

void StorageEngine::RunSerialized(const std::function<void(db::Repository&, db::Transaction&)>& fn) {
  RequireOpen();
  std::lock_guard commit_lock(commit_mutex_);
  try {
    auto tx = repository_->Begin();
    fn(*repository_, *tx);
    tx->Commit();
  } catch (const util::StoreError& e) {
    MarkFailedIfFatal(e);
    throw;
  }
}

void StorageEngine::RunRead(const std::function<void(db::Repository&, db::Transaction&)>& fn) const {
  RequireOpen();
  auto tx = repository_->BeginRead();
  fn(*repository_, *tx);
  tx->Commit();
}

void StorageEngine::RefreshContexts() {
  std::vector<std::shared_ptr<WorkingContext>> live;
  {
    std::lock_guard lock(contexts_mutex_);
    std::erase_if(contexts_, [](const auto& weak) { return weak.expired(); });
    for (const auto& weak : contexts_) {
      if (auto context = weak.lock()) live.push_back(std::move(context));
    }
  }
  for (const auto& context : live) context->Refresh();
}

void StorageEngine::Publish(const CommitSummary& summary) {
  if (bus_ && !summary.Empty()) bus_->commits.Publish(summary);
}

void StorageEngine::Checkpoint() {
  RequireOpen();
  std::lock_guard commit_lock(commit_mutex_);
  try {
    db_->Checkpoint();
  } catch (const util::StoreError& e) {
    MarkFailedIfFatal(e);
    throw;
  }
}

void StorageEngine::Close() {
  if (closed_) return;
  if (!failed_) Checkpoint();
  closed_ = true;
  ARCHSTORE_LOG_INFO("storage engine closed", {observability::StringField("path", db_->Path()),
                                               observability::IntField("last_sequence", static_cast<std::int64_t>(sequence_.load()))});
}

} // namespace archstore::storage
