#include "working_context.hpp"

#include <algorithm>

#include "internal/model/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace archstore::storage {

using db::model::FieldValue;
using db::model::Record;

namespace {

bool Matches(const Record& record, const db::RecordQuery& query) {
  if (query.entity && record.entity != *query.entity) return false;
  if (query.project_id && record.project_id != *query.project_id) return false;
  if (query.after_id && record.id <= *query.after_id) return false;
  if (query.field_equals) {
    const auto* value = record.Find(query.field_equals->first);
    if (!value || *value != query.field_equals->second) return false;
  }
  return true;
}

} // namespace

const char* IsolationName(Isolation isolation) {
  switch (isolation) {
    case Isolation::kDefault:
      return "default";
    case Isolation::kBackground:
      return "background";
    case Isolation::kReadOnly:
      return "read_only";
  }
  return "unknown";
}

Savepoint::Savepoint(Savepoint&& other) noexcept
    : context_id_(other.context_id_),
      valid_(other.valid_),
      inserted_(std::move(other.inserted_)),
      updated_(std::move(other.updated_)),
      deleted_(std::move(other.deleted_)) {
  other.valid_ = false;
}

Savepoint& Savepoint::operator=(Savepoint&& other) noexcept {
  if (this != &other) {
    context_id_  = other.context_id_;
    valid_       = other.valid_;
    inserted_    = std::move(other.inserted_);
    updated_     = std::move(other.updated_);
    deleted_     = std::move(other.deleted_);
    other.valid_ = false;
  }
  return *this;
}

WorkingContext::WorkingContext(uint64_t id, Isolation isolation, std::shared_ptr<db::Repository> repository)
    : id_(id), isolation_(isolation), repository_(std::move(repository)) {
}

void WorkingContext::RequireWritable() const {
  if (isolation_ == Isolation::kReadOnly) {
    throw util::InvalidState("context " + std::to_string(id_) + " is read-only");
  }
}

WorkingContext::Tracked* WorkingContext::LoadLocked(const std::string& id) {
  if (auto it = objects_.find(id); it != objects_.end()) return &it->second;

  auto tx     = repository_->BeginRead();
  auto record = repository_->GetRecord(*tx, id);
  tx->Commit();
  if (!record) return nullptr;

  Tracked tracked;
  tracked.baseline = *record;
  tracked.current  = std::move(*record);
  return &objects_.emplace(id, std::move(tracked)).first->second;
}

WorkingContext::Tracked& WorkingContext::RequireLiveLocked(const std::string& id) {
  auto* tracked = LoadLocked(id);
  if (!tracked || tracked->deleted) throw util::NotFound("record " + id + " not found");
  return *tracked;
}

std::vector<std::string> WorkingContext::DurableIds(const db::RecordQuery& query) {
  auto tx  = repository_->BeginRead();
  auto ids = repository_->ListRecordIds(*tx, query);
  tx->Commit();
  return ids;
}

std::optional<Record> WorkingContext::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  const auto*     tracked = LoadLocked(id);
  if (!tracked || tracked->deleted) return std::nullopt;
  return tracked->current;
}

std::vector<Record> WorkingContext::Fetch(const db::RecordQuery& query) {
  std::lock_guard lock(mutex_);

  std::set<std::string> candidates;
  bool                  dirty = false;
  for (const auto& [id, tracked] : objects_) {
    if (!tracked.Dirty()) continue;
    dirty = true;
    if (!tracked.deleted && Matches(tracked.current, query)) candidates.insert(id);
  }

  // pending changes can move rows in or out of the result, so the durable
  // page is only limited when nothing is pending
  auto durable_query = query;
  if (dirty) durable_query.limit.reset();
  for (auto& id : DurableIds(durable_query)) candidates.insert(std::move(id));

  std::vector<Record> out;
  for (const auto& id : candidates) {
    const auto* tracked = LoadLocked(id);
    if (!tracked || tracked->deleted || !Matches(tracked->current, query)) continue;
    out.push_back(tracked->current);
    if (query.limit && out.size() >= *query.limit) break;
  }
  return out;
}

void WorkingContext::Insert(Record record) {
  RequireWritable();
  if (record.id.empty()) throw util::InvalidState("cannot insert a record without id");

  std::lock_guard lock(mutex_);
  auto*           tracked = LoadLocked(record.id);
  if (tracked && !tracked->deleted) throw util::AlreadyExists("record " + record.id + " already exists");

  if (tracked) {
    // re-insert of a pending delete becomes an update of the durable row
    record.revision      = tracked->baseline->revision;
    record.created_at_ms = tracked->baseline->created_at_ms;
    tracked->current     = std::move(record);
    tracked->deleted     = false;
    return;
  }

  Tracked entry;
  entry.inserted = true;
  entry.current  = std::move(record);
  auto id        = entry.current.id;
  objects_.emplace(std::move(id), std::move(entry));
}

void WorkingContext::Update(Record record) {
  RequireWritable();
  std::lock_guard lock(mutex_);
  auto&           tracked = RequireLiveLocked(record.id);
  if (record.entity != tracked.current.entity) {
    throw util::InvalidState("record " + record.id + " cannot change entity from " + tracked.current.entity + " to " + record.entity);
  }
  record.revision      = tracked.current.revision;
  record.created_at_ms = tracked.current.created_at_ms;
  record.updated_at_ms = tracked.current.updated_at_ms;
  tracked.current      = std::move(record);
}

void WorkingContext::SetField(const std::string& id, const std::string& field, FieldValue value) {
  RequireWritable();
  std::lock_guard lock(mutex_);
  auto&           tracked = RequireLiveLocked(id);
  if (std::holds_alternative<std::monostate>(value)) {
    tracked.current.fields.erase(field);
  } else {
    tracked.current.fields[field] = std::move(value);
  }
}

void WorkingContext::SetRelationships(const std::string& id, std::vector<db::model::Relationship> relationships) {
  RequireWritable();
  std::lock_guard lock(mutex_);
  RequireLiveLocked(id).current.relationships = std::move(relationships);
}

void WorkingContext::Delete(const std::string& id) {
  RequireWritable();
  std::lock_guard lock(mutex_);
  DeleteLocked(id);
}

void WorkingContext::DeleteLocked(const std::string& id) {
  auto& tracked = RequireLiveLocked(id);

  if (tracked.current.entity == model::kProjectEntity) {
    std::set<std::string> children;
    for (auto& child : DurableIds(db::RecordQuery::ForProject(id))) children.insert(std::move(child));
    for (const auto& [child_id, entry] : objects_) {
      if (!entry.deleted && entry.current.project_id == id) children.insert(child_id);
    }
    children.erase(id);
    for (const auto& child : children) {
      const auto* entry = LoadLocked(child);
      if (entry && !entry->deleted && entry->current.project_id == id) DeleteLocked(child);
    }
  }

  if (tracked.inserted) {
    objects_.erase(id);
  } else {
    tracked.deleted = true;
  }
}

bool WorkingContext::HasChanges() const {
  std::lock_guard lock(mutex_);
  return std::any_of(objects_.begin(), objects_.end(), [](const auto& entry) { return entry.second.Dirty(); });
}

ChangeSet WorkingContext::PendingChanges() const {
  std::lock_guard lock(mutex_);
  ChangeSet       changes;
  for (const auto& [id, tracked] : objects_) {
    if (!tracked.Dirty()) continue;
    if (tracked.deleted) {
      changes.deleted.push_back(id);
    } else if (tracked.inserted) {
      changes.inserted.push_back(id);
    } else {
      changes.updated.push_back(id);
    }
  }
  return changes;
}

void WorkingContext::Reset() {
  std::lock_guard lock(mutex_);
  for (auto it = objects_.begin(); it != objects_.end();) {
    if (it->second.inserted) {
      it = objects_.erase(it);
      continue;
    }
    it->second.current = *it->second.baseline;
    it->second.deleted = false;
    ++it;
  }
}

void WorkingContext::Refresh() {
  std::lock_guard lock(mutex_);
  std::erase_if(objects_, [](const auto& entry) { return !entry.second.Dirty(); });
}

Savepoint WorkingContext::CreateSavepoint() const {
  std::lock_guard lock(mutex_);

  Savepoint savepoint;
  savepoint.context_id_ = id_;
  savepoint.valid_      = true;

  for (const auto& [id, tracked] : objects_) {
    if (tracked.inserted) {
      savepoint.inserted_.emplace(id, tracked.current);
      continue;
    }
    if (tracked.deleted) savepoint.deleted_.insert(id);
    if (tracked.current.SameContent(*tracked.baseline)) continue;

    Savepoint::FieldChanges changes;
    const auto&             before = tracked.baseline->fields;
    const auto&             after  = tracked.current.fields;
    for (const auto& [name, value] : after) {
      auto it = before.find(name);
      if (it == before.end() || it->second != value) changes.fields[name] = value;
    }
    for (const auto& [name, value] : before) {
      if (!after.contains(name)) changes.fields[name] = std::nullopt;
    }
    changes.project_id    = tracked.current.project_id;
    changes.relationships = tracked.current.relationships;
    savepoint.updated_.emplace(id, std::move(changes));
  }
  return savepoint;
}

void WorkingContext::CheckSavepoint(const Savepoint& savepoint) const {
  if (!savepoint.valid_) throw util::InvalidState("savepoint already used");
  if (savepoint.context_id_ != id_) {
    throw util::InvalidState("savepoint of context " + std::to_string(savepoint.context_id_) + " used on context " + std::to_string(id_));
  }
}

void WorkingContext::RollbackTo(Savepoint savepoint) {
  CheckSavepoint(savepoint);
  savepoint.valid_ = false;

  std::lock_guard lock(mutex_);

  // un-insert everything inserted after the capture
  std::erase_if(objects_, [&](const auto& entry) { return entry.second.inserted && !savepoint.inserted_.contains(entry.first); });

  for (auto& [id, record] : savepoint.inserted_) {
    Tracked entry;
    entry.inserted = true;
    entry.current  = std::move(record);
    objects_.insert_or_assign(id, std::move(entry));
  }

  std::set<std::string> touched;
  for (const auto& [id, _] : savepoint.updated_) touched.insert(id);
  touched.insert(savepoint.deleted_.begin(), savepoint.deleted_.end());
  for (const auto& id : touched) {
    if (!LoadLocked(id)) {
      ARCHSTORE_LOG_WARN("savepoint record no longer durable", {observability::StringField("record_id", id)});
    }
  }

  for (auto& [id, tracked] : objects_) {
    if (tracked.inserted) continue;
    tracked.current = *tracked.baseline;
    tracked.deleted = savepoint.deleted_.contains(id);

    auto it = savepoint.updated_.find(id);
    if (it == savepoint.updated_.end()) continue;
    for (const auto& [name, value] : it->second.fields) {
      if (value) {
        tracked.current.fields[name] = *value;
      } else {
        tracked.current.fields.erase(name);
      }
    }
    tracked.current.project_id    = it->second.project_id;
    tracked.current.relationships = it->second.relationships;
  }
}

void WorkingContext::Release(Savepoint savepoint) {
  CheckSavepoint(savepoint);
  savepoint.valid_ = false;
}

void WorkingContext::MarkCommittedLocked(const std::vector<Record>& written, const std::vector<std::string>& removed) {
  for (const auto& record : written) {
    Tracked entry;
    entry.baseline = record;
    entry.current  = record;
    objects_.insert_or_assign(record.id, std::move(entry));
  }
  for (const auto& id : removed) objects_.erase(id);
}

void WorkingContext::MergeCommitted(const ChangeSet& changes) {
  std::lock_guard lock(mutex_);
  auto            evict_clean = [this](const std::string& id) {
    auto it = objects_.find(id);
    if (it != objects_.end() && !it->second.Dirty()) objects_.erase(it);
  };
  for (const auto& id : changes.inserted) evict_clean(id);
  for (const auto& id : changes.updated) evict_clean(id);
  for (const auto& id : changes.deleted) evict_clean(id);
}

} // namespace archstore::storage
